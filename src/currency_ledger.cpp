// =============================================================================
// currency_ledger.cpp - Delta ledger with non-zero entry counter
// =============================================================================

#include "flash/currency_ledger.hpp"

namespace flash {

I128 CurrencyLedger::delta(const ParticipantId& participant, const Currency& currency) const {
    auto it = deltas_.find(DeltaKey{participant, currency});
    return it != deltas_.end() ? it->second : 0;
}

void CurrencyLedger::apply_delta(const ParticipantId& participant, const Currency& currency,
                                 I128 amount) {
    if (amount == 0) return;

    DeltaKey key{participant, currency};
    auto it = deltas_.find(key);
    I128 previous = it != deltas_.end() ? it->second : 0;
    I128 next;
    if (__builtin_add_overflow(previous, amount, &next)) {
        throw DeltaOverflow("CurrencyLedger: delta overflow for " +
                            addresses::to_hex(participant) + " in " +
                            addresses::to_hex(currency.addr));
    }

    // Only nonzero entries are stored
    if (next == 0) {
        deltas_.erase(it);
        --nonzero_count_;
    } else if (it == deltas_.end()) {
        deltas_.emplace(key, next);
        ++nonzero_count_;
    } else {
        it->second = next;
    }
}

std::vector<DeltaEntry> CurrencyLedger::nonzero_entries() const {
    std::vector<DeltaEntry> out;
    out.reserve(nonzero_count_);
    for (const auto& [key, amount] : deltas_) {
        out.push_back(DeltaEntry{key.participant, key.currency, amount});
    }
    return out;
}

} // namespace flash
