#ifndef FLASH_BANK_HPP
#define FLASH_BANK_HPP

#include <map>
#include <utility>
#include <vector>

#include "types.hpp"

namespace flash {

// =============================================================================
// Bank Interface (value-transfer collaborator)
// =============================================================================

// Moves value between holders. Every transfer is atomic: it either applies
// fully or throws without effect. snapshot()/revert() let the lock manager
// discard everything a failed session moved.
class IBank {
public:
    virtual ~IBank() = default;

    virtual I128 balance_of(const Currency& currency, const Address& holder) const = 0;

    // Throws InvalidAmount for negative amounts, InsufficientBalance when
    // `from` cannot cover the transfer
    virtual void transfer(const Currency& currency, const Address& from,
                          const Address& to, I128 amount) = 0;

    virtual uint64_t snapshot() = 0;
    virtual void revert(uint64_t snapshot_id) = 0;
    virtual void commit(uint64_t snapshot_id) = 0;
};

// =============================================================================
// MemoryBank - In-process balances with an undo journal
// =============================================================================

class MemoryBank : public IBank {
public:
    MemoryBank() = default;

    // Non-copyable
    MemoryBank(const MemoryBank&) = delete;
    MemoryBank& operator=(const MemoryBank&) = delete;

    I128 balance_of(const Currency& currency, const Address& holder) const override;
    void transfer(const Currency& currency, const Address& from,
                  const Address& to, I128 amount) override;

    // Create value out of thin air (test and scenario setup)
    void mint(const Currency& currency, const Address& holder, I128 amount);

    uint64_t snapshot() override;
    void revert(uint64_t snapshot_id) override;
    void commit(uint64_t snapshot_id) override;

    size_t journal_size() const { return journal_.size(); }

private:
    using BalanceKey = std::pair<Address, Address>;  // (currency, holder)

    struct JournalEntry {
        BalanceKey key;
        I128 previous;
    };

    void set_balance(const BalanceKey& key, I128 value);

    std::map<BalanceKey, I128> balances_;
    std::vector<JournalEntry> journal_;
    size_t open_snapshots_{0};
};

} // namespace flash

#endif // FLASH_BANK_HPP
