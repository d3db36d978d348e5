#ifndef FLASH_LOCK_MANAGER_HPP
#define FLASH_LOCK_MANAGER_HPP

#include <exception>
#include <map>
#include <optional>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "bank.hpp"
#include "lock_stack.hpp"
#include "currency_ledger.hpp"

namespace flash {

// =============================================================================
// Lock Callback Interface
// =============================================================================

class ILockCallback {
public:
    virtual ~ILockCallback() = default;

    // Invoked exactly once per acquire(). May re-enter LockManager::acquire.
    virtual Bytes lock_acquired(const Bytes& payload) = 0;
};

// =============================================================================
// LockManager - Nested flash accounting sessions
// =============================================================================

// Every participant that opens a lock may move value in and out of the
// manager through settle()/take(); the resulting debts are tracked per
// (participant, currency) and must all be zero when the outermost lock closes.
// Inner locks close without any balance check.
//
// If anything throws inside a session, the outermost acquire() restores the
// state captured when the session opened (lock history, ledger, reserves and
// the bank's journal) and rethrows. A failure raised by the manager inside a
// session fails that session even if a callback catches it.
class LockManager {
public:
    explicit LockManager(IBank& bank, Config config = Config{});
    ~LockManager() = default;

    // Non-copyable
    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    // =========================================================================
    // Session Entry Point
    // =========================================================================

    // Open a lock for owner, run callback.lock_acquired(payload), close it.
    // Throws UnsettledBalance if the outermost close finds open deltas.
    Bytes acquire(const ParticipantId& owner, ILockCallback& callback, const Bytes& payload);

    // =========================================================================
    // Settlement Primitives (active lock owner only)
    // =========================================================================

    // Credit the value transferred into the manager since the last
    // settle/take for this currency. Returns the amount credited.
    I128 settle(const Currency& currency);

    // Send amount of currency to recipient, debiting the active owner
    void take(const Currency& currency, const Address& recipient, I128 amount);

    // =========================================================================
    // Queries
    // =========================================================================

    size_t locks_length() const { return stack_.size(); }
    LockIndex lock_index() const;  // Throws NoActiveLock when idle
    const LockRecord& locks(LockIndex index) const { return stack_.record_at(index); }
    std::optional<LockIndex> active_lock() const { return stack_.current(); }
    std::optional<ParticipantId> active_owner() const;

    bool is_locked() const { return stack_.current().has_value(); }
    size_t depth() const { return stack_.depth(); }

    I128 currency_delta(const ParticipantId& owner, const Currency& currency) const {
        return ledger_.delta(owner, currency);
    }
    size_t nonzero_delta_count() const { return ledger_.nonzero_count(); }
    std::vector<DeltaEntry> nonzero_deltas() const { return ledger_.nonzero_entries(); }

    I128 reserves_of(const Currency& currency) const;
    std::map<Currency, I128> reserves() const { return reserves_; }

    const Address& address() const { return config_.manager_address; }
    const Config& config() const { return config_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t sessions_opened;
        uint64_t sessions_completed;
        uint64_t sessions_failed;
        uint64_t locks_acquired;
        uint64_t max_depth;
    };
    Stats get_stats() const { return stats_; }

private:
    // State captured when the outermost lock opens
    struct Checkpoint {
        size_t locks_length;
        CurrencyLedger ledger;
        std::map<Currency, I128> reserves;
        uint64_t bank_snapshot;
    };

    Bytes run_lock(const ParticipantId& owner, ILockCallback& callback, const Bytes& payload);
    I128 settle_active(const Currency& currency);
    void take_active(const Currency& currency, const Address& recipient, I128 amount);
    const ParticipantId& require_owner(const char* op) const;
    void record_failure();
    void rollback(const Checkpoint& checkpoint);

    IBank& bank_;
    Config config_;

    LockStack stack_;
    CurrencyLedger ledger_;
    std::map<Currency, I128> reserves_;

    // First failure raised while the current session was open
    std::exception_ptr failure_;

    Stats stats_{};
};

} // namespace flash

#endif // FLASH_LOCK_MANAGER_HPP
