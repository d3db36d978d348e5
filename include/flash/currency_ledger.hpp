#ifndef FLASH_CURRENCY_LEDGER_HPP
#define FLASH_CURRENCY_LEDGER_HPP

#include <map>
#include <vector>

#include "types.hpp"

namespace flash {

// =============================================================================
// Delta Entry
// =============================================================================

struct DeltaKey {
    ParticipantId participant;
    Currency currency;

    bool operator<(const DeltaKey& other) const {
        if (participant != other.participant) return participant < other.participant;
        return currency < other.currency;
    }
};

struct DeltaEntry {
    ParticipantId participant;
    Currency currency;
    I128 amount;
};

// =============================================================================
// CurrencyLedger - Signed per-(participant, currency) deltas
// =============================================================================

// Positive delta: participant owes the manager.
// Negative delta: manager owes the participant.
class CurrencyLedger {
public:
    CurrencyLedger() = default;

    I128 delta(const ParticipantId& participant, const Currency& currency) const;

    // Add amount to the entry and keep nonzero_count() in step with every
    // zero crossing. Throws DeltaOverflow (and changes nothing) on overflow.
    void apply_delta(const ParticipantId& participant, const Currency& currency, I128 amount);

    size_t nonzero_count() const { return nonzero_count_; }
    size_t stored_entries() const { return deltas_.size(); }

    // Outstanding entries in (participant, currency) order
    std::vector<DeltaEntry> nonzero_entries() const;

private:
    std::map<DeltaKey, I128> deltas_;  // zero entries are erased
    size_t nonzero_count_{0};
};

} // namespace flash

#endif // FLASH_CURRENCY_LEDGER_HPP
