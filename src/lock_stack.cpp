// =============================================================================
// lock_stack.cpp - Lock history and active cursor
// =============================================================================

#include "flash/lock_stack.hpp"
#include <string>

namespace flash {

LockIndex LockStack::push(const ParticipantId& owner) {
    LockIndex index = static_cast<LockIndex>(records_.size());
    records_.push_back(LockRecord{owner, cursor_.value_or(0)});
    cursor_ = index;
    ++depth_;
    return index;
}

void LockStack::pop(LockIndex index) {
    if (!cursor_ || *cursor_ != index) {
        throw InvalidNesting("LockStack: closing lock " + std::to_string(index) +
                             " but active lock is " +
                             (cursor_ ? std::to_string(*cursor_) : std::string("none")));
    }

    --depth_;
    if (depth_ == 0) {
        cursor_.reset();
    } else {
        cursor_ = records_[index].parent_index;
    }
}

const LockRecord& LockStack::record_at(LockIndex index) const {
    if (index >= records_.size()) {
        throw std::out_of_range("LockStack: no lock at index " + std::to_string(index));
    }
    return records_[index];
}

void LockStack::reset(size_t length) {
    if (length < records_.size()) {
        records_.resize(length);
    }
    cursor_.reset();
    depth_ = 0;
}

} // namespace flash
