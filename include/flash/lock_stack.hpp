#ifndef FLASH_LOCK_STACK_HPP
#define FLASH_LOCK_STACK_HPP

#include <optional>
#include <vector>

#include "types.hpp"

namespace flash {

// =============================================================================
// LockStack - Append-only lock history with parent back-pointers
// =============================================================================

// Records are never mutated or removed while a session runs. Only the cursor
// moves: push() advances it to the new record, pop() returns it to the
// record's parent (or to none when the outermost lock closes).
class LockStack {
public:
    LockStack() = default;

    // Append {owner, parent = current cursor (0 if idle)} and make it active
    LockIndex push(const ParticipantId& owner);

    // Close the active record. Throws InvalidNesting if index is not active.
    void pop(LockIndex index);

    std::optional<LockIndex> current() const { return cursor_; }
    size_t depth() const { return depth_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    // Full history including closed records; throws std::out_of_range
    const LockRecord& record_at(LockIndex index) const;
    const std::vector<LockRecord>& records() const { return records_; }

    // Session rollback: drop records past length and return to idle
    void reset(size_t length);

private:
    std::vector<LockRecord> records_;
    std::optional<LockIndex> cursor_;
    size_t depth_{0};
};

} // namespace flash

#endif // FLASH_LOCK_STACK_HPP
