#ifndef FLASH_SCENARIO_HPP
#define FLASH_SCENARIO_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "lock_manager.hpp"

namespace flash {

// =============================================================================
// Scenario Description
// =============================================================================

struct Action {
    enum class Op : uint8_t {
        PAY = 0,     // active owner -> manager transfer
        SETTLE = 1,
        TAKE = 2,
        LOCK = 3     // nested acquire by another (or the same) owner
    };

    Op op;
    Currency currency;
    I128 amount = 0;
    std::optional<Address> to;     // TAKE recipient, defaults to the active owner
    ParticipantId owner{};         // LOCK only
    std::vector<Action> actions;   // LOCK only
};

struct MintSpec {
    Currency currency;
    Address holder;
    I128 amount;
};

struct SessionSpec {
    ParticipantId owner;
    std::vector<Action> actions;
};

struct Scenario {
    std::optional<Address> manager;
    std::vector<MintSpec> mint;
    std::vector<SessionSpec> sessions;

    // Throws ScenarioError describing the first malformed element
    static Scenario from_json(std::string_view content);
    static Scenario from_file(std::string_view path);
};

// =============================================================================
// Report
// =============================================================================

struct SessionOutcome {
    ParticipantId owner;
    int32_t code;           // errors::OK on success
    std::string message;
    uint64_t actions_run;   // Completed actions across all nesting levels
};

struct ScenarioReport {
    Address manager;
    std::vector<SessionOutcome> sessions;
    std::vector<LockRecord> locks;
    std::vector<DeltaEntry> deltas;
    std::map<Currency, I128> reserves;
    LockManager::Stats stats;

    bool all_ok() const;
    std::string to_json(int indent = 2) const;
};

// =============================================================================
// ScenarioRunner - Drives sessions through a scripted locker
// =============================================================================

// Each session runs as one outermost acquire(). A locker's action list
// travels to its callback as the CBOR-encoded payload of that acquire().
class ScenarioRunner {
public:
    explicit ScenarioRunner(Config config = Config{});

    ScenarioReport run(const Scenario& scenario) const;

    // Run against an existing bank; the scenario's mints are added to it.
    // Failures other than FlashError are reported with errors::INTERNAL.
    ScenarioReport run(const Scenario& scenario, MemoryBank& bank) const;

private:
    Config config_;
};

} // namespace flash

#endif // FLASH_SCENARIO_HPP
