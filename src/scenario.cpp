// =============================================================================
// scenario.cpp - JSON scenarios driven through a scripted locker
// =============================================================================

#include "flash/scenario.hpp"
#include "flash/log.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <utility>

namespace flash {

using json = nlohmann::json;

namespace {

constexpr const char* COMPONENT = "scenario";

// =============================================================================
// Decoding
// =============================================================================

Address parse_address(const json& node, const char* field, const std::string& where) {
    if (!node.contains(field) || !node.at(field).is_string()) {
        throw ScenarioError(where + ": missing address field '" + field + "'");
    }
    try {
        return addresses::from_hex(node.at(field).get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ScenarioError(where + ": " + e.what());
    }
}

I128 parse_amount(const json& node, const char* field, const std::string& where) {
    if (!node.contains(field)) {
        throw ScenarioError(where + ": missing amount field '" + field + "'");
    }
    const json& value = node.at(field);
    if (value.is_number_unsigned()) return static_cast<I128>(value.get<uint64_t>());
    if (value.is_number_integer()) return static_cast<I128>(value.get<int64_t>());
    if (value.is_string()) {
        try {
            return parse_i128(value.get<std::string>());
        } catch (const std::exception& e) {
            throw ScenarioError(where + ": " + e.what());
        }
    }
    throw ScenarioError(where + ": amount must be an integer or a decimal string");
}

std::vector<Action> parse_actions(const json& node, const std::string& where);

Action parse_action(const json& node, const std::string& where) {
    if (!node.is_object() || !node.contains("op") || !node.at("op").is_string()) {
        throw ScenarioError(where + ": action needs a string 'op'");
    }

    Action action{};
    const std::string op = node.at("op").get<std::string>();
    if (op == "pay") {
        action.op = Action::Op::PAY;
        action.currency = Currency(parse_address(node, "currency", where));
        action.amount = parse_amount(node, "amount", where);
    } else if (op == "settle") {
        action.op = Action::Op::SETTLE;
        action.currency = Currency(parse_address(node, "currency", where));
    } else if (op == "take") {
        action.op = Action::Op::TAKE;
        action.currency = Currency(parse_address(node, "currency", where));
        action.amount = parse_amount(node, "amount", where);
        if (node.contains("to")) action.to = parse_address(node, "to", where);
    } else if (op == "lock") {
        action.op = Action::Op::LOCK;
        action.owner = parse_address(node, "owner", where);
        action.actions = parse_actions(node.value("actions", json::array()), where + ".actions");
    } else {
        throw ScenarioError(where + ": unknown op '" + op + "'");
    }
    return action;
}

std::vector<Action> parse_actions(const json& node, const std::string& where) {
    if (!node.is_array()) {
        throw ScenarioError(where + ": actions must be an array");
    }
    std::vector<Action> out;
    out.reserve(node.size());
    for (size_t i = 0; i < node.size(); ++i) {
        out.push_back(parse_action(node[i], where + "[" + std::to_string(i) + "]"));
    }
    return out;
}

// =============================================================================
// Payload Encoding
// =============================================================================

json encode_action(const Action& action) {
    switch (action.op) {
        case Action::Op::PAY:
            return {{"op", "pay"},
                    {"currency", addresses::to_hex(action.currency.addr)},
                    {"amount", to_string(action.amount)}};
        case Action::Op::SETTLE:
            return {{"op", "settle"}, {"currency", addresses::to_hex(action.currency.addr)}};
        case Action::Op::TAKE: {
            json node = {{"op", "take"},
                         {"currency", addresses::to_hex(action.currency.addr)},
                         {"amount", to_string(action.amount)}};
            if (action.to) node["to"] = addresses::to_hex(*action.to);
            return node;
        }
        case Action::Op::LOCK: {
            json children = json::array();
            for (const auto& child : action.actions) children.push_back(encode_action(child));
            return {{"op", "lock"},
                    {"owner", addresses::to_hex(action.owner)},
                    {"actions", children}};
        }
    }
    throw ScenarioError("unknown action op");
}

Bytes encode_payload(const std::vector<Action>& actions) {
    json list = json::array();
    for (const auto& action : actions) list.push_back(encode_action(action));
    return json::to_cbor(list);
}

std::vector<Action> decode_payload(const Bytes& payload) {
    json list;
    try {
        list = json::from_cbor(payload);
    } catch (const json::parse_error& e) {
        throw ScenarioError(std::string("payload: ") + e.what());
    }
    return parse_actions(list, "payload");
}

// =============================================================================
// ScriptedLocker
// =============================================================================

class ScriptedLocker : public ILockCallback {
public:
    ScriptedLocker(LockManager& manager, MemoryBank& bank)
        : manager_(manager), bank_(bank) {}

    Bytes lock_acquired(const Bytes& payload) override {
        // The owner of the lock that invoked us is the active one
        ParticipantId owner = *manager_.active_owner();
        uint64_t ran = 0;

        for (const Action& action : decode_payload(payload)) {
            switch (action.op) {
                case Action::Op::PAY:
                    bank_.transfer(action.currency, owner, manager_.address(), action.amount);
                    break;
                case Action::Op::SETTLE:
                    manager_.settle(action.currency);
                    break;
                case Action::Op::TAKE:
                    manager_.take(action.currency, action.to.value_or(owner), action.amount);
                    break;
                case Action::Op::LOCK:
                    manager_.acquire(action.owner, *this, encode_payload(action.actions));
                    break;
            }
            ++ran;
            ++actions_run_;
        }

        return json::to_cbor(json{{"actions", ran}});
    }

    uint64_t actions_run() const { return actions_run_; }
    void reset_count() { actions_run_ = 0; }

private:
    LockManager& manager_;
    MemoryBank& bank_;
    uint64_t actions_run_{0};
};

json amount_json(I128 amount) {
    return to_string(amount);
}

}  // namespace

// =============================================================================
// Scenario
// =============================================================================

Scenario Scenario::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ScenarioError(std::string("Invalid scenario JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ScenarioError("Scenario must be a JSON object");
    }

    Scenario scenario;
    if (doc.contains("manager")) {
        scenario.manager = parse_address(doc, "manager", "scenario");
    }

    const json mint = doc.value("mint", json::array());
    if (!mint.is_array()) throw ScenarioError("scenario: 'mint' must be an array");
    for (size_t i = 0; i < mint.size(); ++i) {
        std::string where = "mint[" + std::to_string(i) + "]";
        scenario.mint.push_back(MintSpec{Currency(parse_address(mint[i], "currency", where)),
                                         parse_address(mint[i], "holder", where),
                                         parse_amount(mint[i], "amount", where)});
    }

    if (!doc.contains("sessions") || !doc.at("sessions").is_array()) {
        throw ScenarioError("scenario: 'sessions' array is required");
    }
    const json& sessions = doc.at("sessions");
    for (size_t i = 0; i < sessions.size(); ++i) {
        std::string where = "sessions[" + std::to_string(i) + "]";
        const json& node = sessions[i];
        if (!node.is_object()) throw ScenarioError(where + ": session must be an object");
        scenario.sessions.push_back(SessionSpec{
            parse_address(node, "owner", where),
            parse_actions(node.value("actions", json::array()), where + ".actions")});
    }

    return scenario;
}

Scenario Scenario::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ScenarioError("Cannot open scenario file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

// =============================================================================
// ScenarioRunner
// =============================================================================

ScenarioRunner::ScenarioRunner(Config config) : config_(std::move(config)) {}

ScenarioReport ScenarioRunner::run(const Scenario& scenario) const {
    MemoryBank bank;
    return run(scenario, bank);
}

ScenarioReport ScenarioRunner::run(const Scenario& scenario, MemoryBank& bank) const {
    Config config = config_;
    if (scenario.manager) config.manager_address = *scenario.manager;

    for (const auto& m : scenario.mint) {
        bank.mint(m.currency, m.holder, m.amount);
    }

    LockManager manager(bank, config);
    ScriptedLocker locker(manager, bank);

    ScenarioReport report{};
    report.manager = manager.address();

    for (size_t i = 0; i < scenario.sessions.size(); ++i) {
        const SessionSpec& session = scenario.sessions[i];
        SessionOutcome outcome{session.owner, errors::OK, "", 0};
        locker.reset_count();

        try {
            manager.acquire(session.owner, locker, encode_payload(session.actions));
        } catch (const FlashError& e) {
            outcome.code = e.code();
            outcome.message = e.what();
        } catch (const std::exception& e) {
            outcome.code = errors::INTERNAL;
            outcome.message = e.what();
        }
        outcome.actions_run = locker.actions_run();

        FLASH_LOG_INFO(COMPONENT, "session " << i << " by " << addresses::to_hex(session.owner)
                       << ": " << errors::name(outcome.code));
        report.sessions.push_back(std::move(outcome));
    }

    report.locks.assign(manager.locks_length(), LockRecord{});
    for (LockIndex i = 0; i < manager.locks_length(); ++i) {
        report.locks[i] = manager.locks(i);
    }
    report.deltas = manager.nonzero_deltas();
    report.reserves = manager.reserves();
    report.stats = manager.get_stats();
    return report;
}

// =============================================================================
// ScenarioReport
// =============================================================================

bool ScenarioReport::all_ok() const {
    for (const auto& s : sessions) {
        if (s.code != errors::OK) return false;
    }
    return true;
}

std::string ScenarioReport::to_json(int indent) const {
    json doc;
    doc["manager"] = addresses::to_hex(manager);

    json session_list = json::array();
    for (const auto& s : sessions) {
        json node = {{"owner", addresses::to_hex(s.owner)},
                     {"ok", s.code == errors::OK},
                     {"actions_run", s.actions_run}};
        if (s.code != errors::OK) {
            node["error"] = errors::name(s.code);
            node["code"] = s.code;
            node["message"] = s.message;
        }
        session_list.push_back(node);
    }
    doc["sessions"] = session_list;

    json lock_list = json::array();
    for (size_t i = 0; i < locks.size(); ++i) {
        lock_list.push_back(json{{"index", i},
                             {"owner", addresses::to_hex(locks[i].owner)},
                             {"parent", locks[i].parent_index}});
    }
    doc["locks"] = lock_list;

    json delta_list = json::array();
    for (const auto& d : deltas) {
        delta_list.push_back(json{{"participant", addresses::to_hex(d.participant)},
                              {"currency", addresses::to_hex(d.currency.addr)},
                              {"amount", amount_json(d.amount)}});
    }
    doc["nonzero_deltas"] = delta_list;

    json reserve_map = json::object();
    for (const auto& [currency, amount] : reserves) {
        reserve_map[addresses::to_hex(currency.addr)] = amount_json(amount);
    }
    doc["reserves"] = reserve_map;

    doc["stats"] = {{"sessions_opened", stats.sessions_opened},
                    {"sessions_completed", stats.sessions_completed},
                    {"sessions_failed", stats.sessions_failed},
                    {"locks_acquired", stats.locks_acquired},
                    {"max_depth", stats.max_depth}};

    return doc.dump(indent);
}

} // namespace flash
