// =============================================================================
// bank.cpp - In-memory value-transfer collaborator
// =============================================================================

#include "flash/bank.hpp"
#include <string>

namespace flash {

I128 MemoryBank::balance_of(const Currency& currency, const Address& holder) const {
    auto it = balances_.find(BalanceKey{currency.addr, holder});
    return it != balances_.end() ? it->second : 0;
}

void MemoryBank::transfer(const Currency& currency, const Address& from,
                          const Address& to, I128 amount) {
    if (amount < 0) {
        throw InvalidAmount("MemoryBank: negative transfer amount " + to_string(amount));
    }

    BalanceKey from_key{currency.addr, from};
    BalanceKey to_key{currency.addr, to};

    I128 from_balance = balance_of(currency, from);
    if (from_balance < amount) {
        throw InsufficientBalance("MemoryBank: " + addresses::to_hex(from) + " holds " +
                                  to_string(from_balance) + ", needs " + to_string(amount));
    }
    if (amount == 0 || from == to) return;

    I128 to_balance = balance_of(currency, to);
    I128 credited;
    if (__builtin_add_overflow(to_balance, amount, &credited)) {
        throw InvalidAmount("MemoryBank: balance overflow for " + addresses::to_hex(to));
    }

    set_balance(from_key, from_balance - amount);
    set_balance(to_key, credited);
}

void MemoryBank::mint(const Currency& currency, const Address& holder, I128 amount) {
    if (amount < 0) {
        throw InvalidAmount("MemoryBank: negative mint amount " + to_string(amount));
    }

    I128 minted;
    if (__builtin_add_overflow(balance_of(currency, holder), amount, &minted)) {
        throw InvalidAmount("MemoryBank: balance overflow for " + addresses::to_hex(holder));
    }
    set_balance(BalanceKey{currency.addr, holder}, minted);
}

// =============================================================================
// Journal
// =============================================================================

uint64_t MemoryBank::snapshot() {
    ++open_snapshots_;
    return static_cast<uint64_t>(journal_.size());
}

void MemoryBank::revert(uint64_t snapshot_id) {
    if (open_snapshots_ == 0 || snapshot_id > journal_.size()) {
        throw std::invalid_argument("MemoryBank: unknown snapshot " + std::to_string(snapshot_id));
    }

    while (journal_.size() > snapshot_id) {
        const JournalEntry& entry = journal_.back();
        if (entry.previous == 0) {
            balances_.erase(entry.key);
        } else {
            balances_[entry.key] = entry.previous;
        }
        journal_.pop_back();
    }

    if (--open_snapshots_ == 0) journal_.clear();
}

void MemoryBank::commit(uint64_t snapshot_id) {
    if (open_snapshots_ == 0 || snapshot_id > journal_.size()) {
        throw std::invalid_argument("MemoryBank: unknown snapshot " + std::to_string(snapshot_id));
    }

    if (--open_snapshots_ == 0) journal_.clear();
}

void MemoryBank::set_balance(const BalanceKey& key, I128 value) {
    if (open_snapshots_ > 0) {
        auto it = balances_.find(key);
        journal_.push_back(JournalEntry{key, it != balances_.end() ? it->second : 0});
    }

    if (value == 0) {
        balances_.erase(key);
    } else {
        balances_[key] = value;
    }
}

} // namespace flash
