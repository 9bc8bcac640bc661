#include "common/errors.hpp"
#include "common/log.hpp"
#include "config/search_space_loader.hpp"
#include "search/search_driver.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace modex;

namespace {

enum ExitCode {
    kSuccess = 0,
    kFailure = 1,
    kConfigError = 2,
    kExhausted = 3,
    kTimeout = 4
};

struct RunArgs {
    std::string space_path;
    std::optional<size_t> iterations;
    std::optional<uint64_t> seed;
    std::string checkpoint;
    bool resume = false;
    std::string log_level;
};

void printUsage() {
    std::cout << R"(modex - generator composition and exploration engine

Usage:
  modex run <space.yaml> [--iterations N] [--seed S] [--checkpoint FILE]
                         [--resume] [--log-level LEVEL]
  modex help

Exit codes:
  0  search produced a result
  1  other failure
  2  configuration error
  3  search exhausted without a result
  4  wall-clock budget ran out before a result
)";
}

uint64_t parseNumber(const std::string& flag, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("expected a non-negative integer, got '" + text + "'", flag);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ConfigError("value '" + text + "' is too large", flag);
    }
}

RunArgs parseRunArgs(int argc, char** argv) {
    RunArgs args;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError("missing value", arg);
            return argv[++i];
        };
        if (arg == "--iterations") {
            args.iterations = parseNumber(arg, value());
        } else if (arg == "--seed") {
            args.seed = parseNumber(arg, value());
        } else if (arg == "--checkpoint") {
            args.checkpoint = value();
        } else if (arg == "--resume") {
            args.resume = true;
        } else if (arg == "--log-level") {
            args.log_level = value();
        } else if (!arg.empty() && arg[0] == '-') {
            throw ConfigError("unknown option '" + arg + "'");
        } else if (args.space_path.empty()) {
            args.space_path = arg;
        } else {
            throw ConfigError("unexpected argument '" + arg + "'");
        }
    }
    if (args.space_path.empty()) {
        throw ConfigError("missing search space file");
    }
    if (args.resume && args.checkpoint.empty()) {
        throw ConfigError("--resume needs --checkpoint FILE");
    }
    return args;
}

int cmdRun(int argc, char** argv) {
    RunArgs args = parseRunArgs(argc, argv);
    if (!args.log_level.empty()) setLogLevel(parseLogLevel(args.log_level));

    SearchSpaceLoader loader;
    SearchSpaceSpec spec = loader.loadFile(args.space_path);
    if (args.log_level.empty()) setLogLevel(parseLogLevel(spec.log_level));

    if (args.iterations) spec.options.iterations = *args.iterations;
    if (args.seed) spec.options.seed = *args.seed;
    if (!args.checkpoint.empty()) spec.options.checkpoint_path = args.checkpoint;
    spec.options.resume = args.resume;

    Schedule schedule = spec.buildSchedule();
    SearchDriver driver(schedule, spec.options);
    SearchOutcome outcome = driver.run();

    std::cout << "status: " << searchStatusName(outcome.status) << "\n"
              << "emitted: " << outcome.emitted << "\n";
    if (outcome.best) {
        std::cout << "best: " << outcome.best->describe() << " from '" << outcome.best_stream << "'";
        if (outcome.best_score) std::cout << " score " << *outcome.best_score;
        std::cout << "\n";
    }

    switch (outcome.status) {
        case SearchStatus::Success: return kSuccess;
        case SearchStatus::Exhausted: return kExhausted;
        case SearchStatus::Timeout: return kTimeout;
    }
    return kFailure;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return kFailure;
    }
    std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        printUsage();
        return kSuccess;
    }
    if (command != "run") {
        std::cerr << "unknown command '" << command << "'\n";
        printUsage();
        return kFailure;
    }

    try {
        return cmdRun(argc, argv);
    } catch (const ConfigError& e) {
        logger()->error("configuration error: {}", e.what());
        return kConfigError;
    } catch (const std::exception& e) {
        logger()->error("{}", e.what());
        return kFailure;
    }
}
