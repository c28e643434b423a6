// =============================================================================
// ledger.cpp - PXLedger in-memory ledger implementation
// =============================================================================

#include "predix/ledger.hpp"
#include "predix/math.hpp"
#include <algorithm>

namespace predix {

// =============================================================================
// Constructor
// =============================================================================

PXLedger::PXLedger(Timestamp start_time) : now_(start_time) {}

// =============================================================================
// Journal Helpers
// =============================================================================

bool PXLedger::recording() const {
    return in_tx_ && tx_owner_ == std::this_thread::get_id();
}

void PXLedger::record_balance(const LedgerAccount& account) {
    if (!recording()) return;
    auto it = balances_.find(account);
    JournalEntry entry{};
    entry.kind = JournalEntry::Kind::BALANCE;
    entry.account = account;
    entry.existed = it != balances_.end();
    entry.previous = entry.existed ? it->second : 0;
    journal_.push_back(entry);
}

void PXLedger::record_supply(const Currency& currency) {
    if (!recording()) return;
    auto it = supplies_.find(currency);
    JournalEntry entry{};
    entry.kind = JournalEntry::Kind::SUPPLY;
    entry.currency = currency;
    entry.existed = it != supplies_.end();
    entry.previous = entry.existed ? it->second : 0;
    journal_.push_back(entry);
}

uint64_t PXLedger::balance_locked(const LedgerAccount& account) const {
    auto it = balances_.find(account);
    return (it != balances_.end()) ? it->second : 0;
}

// =============================================================================
// Transfers
// =============================================================================

int32_t PXLedger::transfer(const LedgerAccount& from, const LedgerAccount& to, uint64_t amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }
    if (from.currency != to.currency) {
        return errors::TRANSFER_FAILED;
    }

    std::unique_lock lock(state_mutex_);

    if (std::find(failing_owners_.begin(), failing_owners_.end(), from.owner) != failing_owners_.end()) {
        return errors::TRANSFER_FAILED;
    }

    uint64_t from_balance = balance_locked(from);
    if (from_balance < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    // Self-transfer moves nothing
    if (from == to) {
        total_transfers_.fetch_add(1, std::memory_order_relaxed);
        return errors::OK;
    }

    uint64_t new_to = 0;
    int32_t rc = checked::add(balance_locked(to), amount, new_to);
    if (rc != errors::OK) return rc;

    record_balance(from);
    record_balance(to);
    balances_[from] = from_balance - amount;
    balances_[to] = new_to;

    total_transfers_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t PXLedger::mint(const Address& authority, const Currency& mint,
                       const LedgerAccount& to, uint64_t amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }
    if (to.currency != mint) {
        return errors::TRANSFER_FAILED;
    }

    std::unique_lock lock(state_mutex_);

    auto auth_it = mint_authorities_.find(mint);
    if (auth_it == mint_authorities_.end()) {
        return errors::MINT_NOT_FOUND;
    }
    if (auth_it->second != authority) {
        return errors::INVALID_AUTHORITY;
    }

    uint64_t new_supply = 0;
    uint64_t new_balance = 0;
    int32_t rc = checked::add(supplies_[mint], amount, new_supply);
    if (rc != errors::OK) return rc;
    rc = checked::add(balance_locked(to), amount, new_balance);
    if (rc != errors::OK) return rc;

    record_supply(mint);
    record_balance(to);
    supplies_[mint] = new_supply;
    balances_[to] = new_balance;

    total_mints_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t PXLedger::burn(const LedgerAccount& from, uint64_t amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(state_mutex_);

    auto supply_it = supplies_.find(from.currency);
    if (supply_it == supplies_.end()) {
        return errors::MINT_NOT_FOUND;
    }

    uint64_t balance = balance_locked(from);
    if (balance < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    if (supply_it->second < amount) {
        return errors::ARITHMETIC_UNDERFLOW;
    }

    record_supply(from.currency);
    record_balance(from);
    supply_it->second -= amount;
    balances_[from] = balance - amount;

    total_burns_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t PXLedger::initialize_mint(const Currency& mint, const Address& authority) {
    std::unique_lock lock(state_mutex_);

    if (mint_authorities_.find(mint) != mint_authorities_.end()) {
        return errors::MINT_ALREADY_EXISTS;
    }

    if (recording()) {
        JournalEntry entry{};
        entry.kind = JournalEntry::Kind::MINT_CREATED;
        entry.currency = mint;
        journal_.push_back(entry);
    }
    mint_authorities_[mint] = authority;
    supplies_[mint] = 0;
    return errors::OK;
}

// =============================================================================
// Clock & Authority
// =============================================================================

Timestamp PXLedger::current_time() const {
    return now_.load(std::memory_order_acquire);
}

void PXLedger::set_time(Timestamp t) {
    // Clock never moves backwards
    Timestamp current = now_.load(std::memory_order_acquire);
    while (t > current && !now_.compare_exchange_weak(current, t)) {
    }
}

void PXLedger::advance_time(Timestamp seconds) {
    if (seconds > 0) now_.fetch_add(seconds, std::memory_order_acq_rel);
}

bool PXLedger::verify_authority(const Address& signer, const Address& required) const {
    return !is_zero_address(required) && signer == required;
}

// =============================================================================
// Transactions
// =============================================================================

void PXLedger::begin() {
    tx_mutex_.lock();
    std::unique_lock lock(state_mutex_);
    journal_.clear();
    tx_owner_ = std::this_thread::get_id();
    in_tx_ = true;
}

void PXLedger::commit() {
    {
        std::unique_lock lock(state_mutex_);
        if (!recording()) return;
        journal_.clear();
        in_tx_ = false;
    }
    tx_mutex_.unlock();
}

void PXLedger::rollback() {
    {
        std::unique_lock lock(state_mutex_);
        if (!recording()) return;

        for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
            switch (it->kind) {
                case JournalEntry::Kind::BALANCE:
                    if (it->existed) balances_[it->account] = it->previous;
                    else balances_.erase(it->account);
                    break;
                case JournalEntry::Kind::SUPPLY:
                    if (it->existed) supplies_[it->currency] = it->previous;
                    else supplies_.erase(it->currency);
                    break;
                case JournalEntry::Kind::MINT_CREATED:
                    mint_authorities_.erase(it->currency);
                    supplies_.erase(it->currency);
                    break;
            }
        }
        journal_.clear();
        in_tx_ = false;
        total_rollbacks_.fetch_add(1, std::memory_order_relaxed);
    }
    tx_mutex_.unlock();
}

// =============================================================================
// Funding & Queries
// =============================================================================

int32_t PXLedger::credit(const LedgerAccount& account, uint64_t amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(state_mutex_);
    uint64_t new_balance = 0;
    int32_t rc = checked::add(balance_locked(account), amount, new_balance);
    if (rc != errors::OK) return rc;

    record_balance(account);
    balances_[account] = new_balance;
    return errors::OK;
}

uint64_t PXLedger::balance_of(const LedgerAccount& account) const {
    std::shared_lock lock(state_mutex_);
    return balance_locked(account);
}

uint64_t PXLedger::total_supply(const Currency& mint) const {
    std::shared_lock lock(state_mutex_);
    auto it = supplies_.find(mint);
    return (it != supplies_.end()) ? it->second : 0;
}

bool PXLedger::mint_exists(const Currency& mint) const {
    std::shared_lock lock(state_mutex_);
    return mint_authorities_.find(mint) != mint_authorities_.end();
}

uint64_t PXLedger::total_balance(const Currency& currency) const {
    std::shared_lock lock(state_mutex_);
    uint64_t total = 0;
    for (const auto& [account, balance] : balances_) {
        if (account.currency == currency) total += balance;
    }
    return total;
}

void PXLedger::set_fail_transfers_from(const Address& owner, bool fail) {
    std::unique_lock lock(state_mutex_);
    auto it = std::find(failing_owners_.begin(), failing_owners_.end(), owner);
    if (fail && it == failing_owners_.end()) {
        failing_owners_.push_back(owner);
    } else if (!fail && it != failing_owners_.end()) {
        failing_owners_.erase(it);
    }
}

PXLedger::Stats PXLedger::get_stats() const {
    return Stats{
        total_transfers_.load(),
        total_mints_.load(),
        total_burns_.load(),
        total_rollbacks_.load()
    };
}

} // namespace predix
