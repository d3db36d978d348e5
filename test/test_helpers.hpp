// flash - shared test fixtures

#ifndef FLASH_TEST_HELPERS_HPP
#define FLASH_TEST_HELPERS_HPP

#include <flash/lock_manager.hpp>
#include <functional>
#include <utility>

namespace flash::test {

inline const ParticipantId ALICE = addresses::from_lp(0x0a01);
inline const ParticipantId BOB = addresses::from_lp(0x0b01);
inline const ParticipantId CAROL = addresses::from_lp(0x0c01);

inline const Currency USD{addresses::from_lp(0x1001)};
inline const Currency ETH{addresses::from_lp(0x1002)};

// Callback backed by a lambda; counts invocations
class FnLocker : public ILockCallback {
public:
    using Fn = std::function<Bytes(const Bytes&)>;

    explicit FnLocker(Fn fn) : fn_(std::move(fn)) {}

    Bytes lock_acquired(const Bytes& payload) override {
        ++calls_;
        return fn_(payload);
    }

    int calls() const { return calls_; }

private:
    Fn fn_;
    int calls_ = 0;
};

}  // namespace flash::test

#endif // FLASH_TEST_HELPERS_HPP
