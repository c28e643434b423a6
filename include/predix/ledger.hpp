#ifndef PREDIX_LEDGER_HPP
#define PREDIX_LEDGER_HPP

#include <unordered_map>
#include <map>
#include <shared_mutex>
#include <mutex>
#include <thread>
#include <vector>
#include <atomic>

#include "types.hpp"

namespace predix {

// =============================================================================
// Ledger Interface
// The execution environment that physically moves balances. The engine treats
// every non-OK return as fatal for the current operation.
// =============================================================================

class ILedger {
public:
    virtual ~ILedger() = default;

    // Move `amount` between two accounts of the same currency
    virtual int32_t transfer(const LedgerAccount& from, const LedgerAccount& to, uint64_t amount) = 0;

    // Issue `amount` of `mint` to `to`; `authority` must be the mint authority
    virtual int32_t mint(const Address& authority, const Currency& mint,
                         const LedgerAccount& to, uint64_t amount) = 0;

    // Destroy `amount` from `from`
    virtual int32_t burn(const LedgerAccount& from, uint64_t amount) = 0;

    // Register a new mint controlled by `authority`
    virtual int32_t initialize_mint(const Currency& mint, const Address& authority) = 0;

    // Monotonically non-decreasing wall clock
    virtual Timestamp current_time() const = 0;

    // Capability check: does `signer` hold the `required` authority
    virtual bool verify_authority(const Address& signer, const Address& required) const = 0;

    // Transaction boundary: everything between begin() and commit() applies
    // atomically; rollback() reverts it.
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// =============================================================================
// LedgerTransaction - RAII guard, rolls back unless committed
// =============================================================================

class LedgerTransaction {
public:
    explicit LedgerTransaction(ILedger& ledger) : ledger_(ledger) { ledger_.begin(); }
    ~LedgerTransaction() {
        if (!done_) ledger_.rollback();
    }

    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;

    void commit() {
        ledger_.commit();
        done_ = true;
    }

private:
    ILedger& ledger_;
    bool done_{false};
};

// =============================================================================
// PXLedger - In-memory ledger with undo journal
// =============================================================================

class PXLedger : public ILedger {
public:
    explicit PXLedger(Timestamp start_time = 0);
    ~PXLedger() override = default;

    // Non-copyable
    PXLedger(const PXLedger&) = delete;
    PXLedger& operator=(const PXLedger&) = delete;

    // =========================================================================
    // ILedger
    // =========================================================================

    int32_t transfer(const LedgerAccount& from, const LedgerAccount& to, uint64_t amount) override;
    int32_t mint(const Address& authority, const Currency& mint,
                 const LedgerAccount& to, uint64_t amount) override;
    int32_t burn(const LedgerAccount& from, uint64_t amount) override;
    int32_t initialize_mint(const Currency& mint, const Address& authority) override;

    Timestamp current_time() const override;
    bool verify_authority(const Address& signer, const Address& required) const override;

    void begin() override;
    void commit() override;
    void rollback() override;

    // =========================================================================
    // Funding & Queries
    // =========================================================================

    // Credit an account from outside the ledger (deposit)
    int32_t credit(const LedgerAccount& account, uint64_t amount);

    uint64_t balance_of(const LedgerAccount& account) const;
    uint64_t total_supply(const Currency& mint) const;
    bool mint_exists(const Currency& mint) const;

    // Sum of all balances held in `currency`
    uint64_t total_balance(const Currency& currency) const;

    // =========================================================================
    // Clock
    // =========================================================================

    void set_time(Timestamp t);
    void advance_time(Timestamp seconds);

    // =========================================================================
    // Fault Injection
    // Transfers out of a listed owner fail with TRANSFER_FAILED.
    // =========================================================================

    void set_fail_transfers_from(const Address& owner, bool fail);

    struct Stats {
        uint64_t total_transfers;
        uint64_t total_mints;
        uint64_t total_burns;
        uint64_t total_rollbacks;
    };
    Stats get_stats() const;

private:
    // Balances: (owner, currency) -> amount
    std::unordered_map<LedgerAccount, uint64_t, LedgerAccountHash> balances_;

    // Mint registry: currency -> authority / supply
    std::map<Currency, Address> mint_authorities_;
    std::map<Currency, uint64_t> supplies_;

    mutable std::shared_mutex state_mutex_;

    std::vector<Address> failing_owners_;

    std::atomic<Timestamp> now_;

    // Undo journal (one open transaction at a time)
    struct JournalEntry {
        enum class Kind : uint8_t { BALANCE, SUPPLY, MINT_CREATED };
        Kind kind;
        LedgerAccount account;   // BALANCE
        Currency currency;       // SUPPLY / MINT_CREATED
        uint64_t previous;
        bool existed;
    };
    std::vector<JournalEntry> journal_;
    std::mutex tx_mutex_;
    std::thread::id tx_owner_;
    bool in_tx_{false};

    // Statistics
    std::atomic<uint64_t> total_transfers_{0};
    std::atomic<uint64_t> total_mints_{0};
    std::atomic<uint64_t> total_burns_{0};
    std::atomic<uint64_t> total_rollbacks_{0};

    // Internal helpers (state_mutex_ held exclusively)
    bool recording() const;
    void record_balance(const LedgerAccount& account);
    void record_supply(const Currency& currency);
    uint64_t balance_locked(const LedgerAccount& account) const;
};

} // namespace predix

#endif // PREDIX_LEDGER_HPP
