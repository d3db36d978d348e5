// flashctl - run nested flash accounting scenarios
//
// Reads a JSON scenario, drives every session through a LockManager and
// prints the resulting audit report (sessions, lock history, open deltas).

#include "flash/config.hpp"
#include "flash/log.hpp"
#include "flash/scenario.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    bool verbose = false;
    bool compact = false;
    std::vector<std::string> command_args;
};

void print_usage(const char* prog) {
    std::cout << "flashctl - nested flash accounting scenarios\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  JSON config (log_level, max_lock_depth, manager_address)\n"
              << "  -v, --verbose        Debug logging\n"
              << "      --compact        Single-line JSON output\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  run <scenario.json>       Execute scenario and print report\n"
              << "  validate <scenario.json>  Parse scenario without executing it\n\n"
              << "Exit status: 0 all sessions settled, 2 a session failed, 1 usage/input error\n";
}

int run_command(const flash::Config& config, const Options& opts) {
    const auto& args = opts.command_args;
    if (args.empty()) {
        std::cerr << "No command specified. Use -h for help.\n";
        return 1;
    }

    const std::string& cmd = args[0];
    if (cmd == "run" || cmd == "validate") {
        if (args.size() < 2) {
            std::cerr << "Usage: flashctl " << cmd << " <scenario.json>\n";
            return 1;
        }

        flash::Scenario scenario = flash::Scenario::from_file(args[1]);
        if (cmd == "validate") {
            std::cout << "ok: " << scenario.sessions.size() << " sessions, "
                      << scenario.mint.size() << " mints\n";
            return 0;
        }

        flash::ScenarioRunner runner(config);
        flash::ScenarioReport report = runner.run(scenario);
        std::cout << report.to_json(opts.compact ? -1 : 2) << "\n";
        return report.all_ok() ? 0 : 2;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--compact") {
            opts.compact = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            opts.command_args.push_back(arg);
        }
    }

    try {
        flash::Config config = opts.config_path.empty()
            ? flash::Config{}
            : flash::Config::from_file(opts.config_path);
        config.apply_logging();
        if (opts.verbose) {
            flash::log::set_level(flash::log::Level::DEBUG);
        }

        return run_command(config, opts);
    } catch (const flash::FlashError& e) {
        std::cerr << "Error (" << flash::errors::name(e.code()) << "): " << e.what() << "\n";
        return 1;
    }
}
