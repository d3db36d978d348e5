// =============================================================================
// lock_manager.cpp - Nested flash accounting sessions
// =============================================================================

#include "flash/lock_manager.hpp"
#include "flash/log.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace flash {

namespace {

constexpr const char* COMPONENT = "lock_manager";

}  // namespace

// =============================================================================
// Constructor
// =============================================================================

LockManager::LockManager(IBank& bank, Config config)
    : bank_(bank), config_(std::move(config)) {}

// =============================================================================
// Session Entry Point
// =============================================================================

Bytes LockManager::acquire(const ParticipantId& owner, ILockCallback& callback,
                           const Bytes& payload) {
    if (stack_.current().has_value()) {
        try {
            if (config_.max_lock_depth != 0 && stack_.depth() >= config_.max_lock_depth) {
                throw LockDepthExceeded("LockManager: depth limit " +
                                        std::to_string(config_.max_lock_depth) +
                                        " reached by " + addresses::to_hex(owner));
            }
            return run_lock(owner, callback, payload);
        } catch (...) {
            record_failure();
            throw;
        }
    }

    // Outermost lock: everything below runs inside one revertible session
    Checkpoint checkpoint{stack_.size(), ledger_, reserves_, bank_.snapshot()};
    ++stats_.sessions_opened;
    failure_ = nullptr;

    try {
        Bytes result = run_lock(owner, callback, payload);

        if (failure_) {
            std::rethrow_exception(failure_);
        }

        if (ledger_.nonzero_count() != 0) {
            throw UnsettledBalance("LockManager: " + std::to_string(ledger_.nonzero_count()) +
                                   " currency deltas unsettled at release of lock " +
                                   std::to_string(checkpoint.locks_length));
        }

        bank_.commit(checkpoint.bank_snapshot);
        ++stats_.sessions_completed;
        return result;
    } catch (...) {
        rollback(checkpoint);
        FLASH_LOG_WARN(COMPONENT, "session opened by " << addresses::to_hex(owner)
                       << " rolled back");
        throw;
    }
}

Bytes LockManager::run_lock(const ParticipantId& owner, ILockCallback& callback,
                            const Bytes& payload) {
    LockIndex index = stack_.push(owner);
    ++stats_.locks_acquired;
    stats_.max_depth = std::max<uint64_t>(stats_.max_depth, stack_.depth());
    FLASH_LOG_DEBUG(COMPONENT, "lock " << index << " opened by " << addresses::to_hex(owner)
                    << " (parent " << stack_.record_at(index).parent_index
                    << ", depth " << stack_.depth() << ")");

    Bytes result = callback.lock_acquired(payload);

    stack_.pop(index);
    FLASH_LOG_DEBUG(COMPONENT, "lock " << index << " closed");
    return result;
}

// Remember the first failure of the open session so a callback cannot hide it
void LockManager::record_failure() {
    if (!failure_ && stack_.current().has_value()) {
        failure_ = std::current_exception();
    }
}

void LockManager::rollback(const Checkpoint& checkpoint) {
    stack_.reset(checkpoint.locks_length);
    ledger_ = checkpoint.ledger;
    reserves_ = checkpoint.reserves;
    bank_.revert(checkpoint.bank_snapshot);
    failure_ = nullptr;
    ++stats_.sessions_failed;
}

// =============================================================================
// Settlement Primitives
// =============================================================================

I128 LockManager::settle(const Currency& currency) {
    try {
        return settle_active(currency);
    } catch (...) {
        record_failure();
        throw;
    }
}

void LockManager::take(const Currency& currency, const Address& recipient, I128 amount) {
    try {
        take_active(currency, recipient, amount);
    } catch (...) {
        record_failure();
        throw;
    }
}

I128 LockManager::settle_active(const Currency& currency) {
    ParticipantId owner = require_owner("settle");

    I128 reserves = reserves_of(currency);
    I128 balance = bank_.balance_of(currency, address());
    if (balance < reserves) {
        throw InsufficientReserve("LockManager: holds " + to_string(balance) + " of " +
                                  addresses::to_hex(currency.addr) + " but reserves are " +
                                  to_string(reserves));
    }

    I128 paid = balance - reserves;
    if (paid == 0) return 0;

    // Ledger first: it is the only step that can fail
    ledger_.apply_delta(owner, currency, -paid);
    reserves_[currency] = balance;

    FLASH_LOG_DEBUG(COMPONENT, "settle " << to_string(paid) << " of "
                    << addresses::to_hex(currency.addr) << " for " << addresses::to_hex(owner));
    return paid;
}

void LockManager::take_active(const Currency& currency, const Address& recipient,
                              I128 amount) {
    ParticipantId owner = require_owner("take");

    if (amount < 0) {
        throw InvalidAmount("LockManager: negative take amount " + to_string(amount));
    }

    I128 reserves = reserves_of(currency);
    if (reserves < amount) {
        throw InsufficientReserve("LockManager: take of " + to_string(amount) + " " +
                                  addresses::to_hex(currency.addr) + " exceeds reserves " +
                                  to_string(reserves));
    }
    if (amount == 0) return;

    ledger_.apply_delta(owner, currency, amount);
    try {
        bank_.transfer(currency, address(), recipient, amount);
    } catch (const InsufficientBalance& e) {
        ledger_.apply_delta(owner, currency, -amount);
        throw InsufficientReserve(std::string("LockManager: transfer failed: ") + e.what());
    }

    if (reserves == amount) {
        reserves_.erase(currency);
    } else {
        reserves_[currency] = reserves - amount;
    }

    FLASH_LOG_DEBUG(COMPONENT, "take " << to_string(amount) << " of "
                    << addresses::to_hex(currency.addr) << " to " << addresses::to_hex(recipient)
                    << " for " << addresses::to_hex(owner));
}

// =============================================================================
// Queries
// =============================================================================

LockIndex LockManager::lock_index() const {
    auto cursor = stack_.current();
    if (!cursor) {
        throw NoActiveLock("LockManager: no lock is held");
    }
    return *cursor;
}

std::optional<ParticipantId> LockManager::active_owner() const {
    auto cursor = stack_.current();
    if (!cursor) return std::nullopt;
    return stack_.record_at(*cursor).owner;
}

I128 LockManager::reserves_of(const Currency& currency) const {
    auto it = reserves_.find(currency);
    return it != reserves_.end() ? it->second : 0;
}

const ParticipantId& LockManager::require_owner(const char* op) const {
    auto cursor = stack_.current();
    if (!cursor) {
        throw NoActiveLock(std::string("LockManager: ") + op + " called without a lock");
    }
    return stack_.record_at(*cursor).owner;
}

} // namespace flash
