// =============================================================================
// swiss-uid - Command-Line Tool
// =============================================================================
// Main entry point for the suid command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: check, format, generate
// - Global options: verbose, quiet, log-level, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "suid/common/error.h"
#include "suid/common/logger.h"

#include "commands/check_command.h"
#include "commands/format_command.h"
#include "commands/generate_command.h"

namespace suid::commands {
int runCheck(CLI::App* app);
int runFormat(CLI::App* app);
int runGenerate(CLI::App* app);
}  // namespace suid::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.2.0";
constexpr const char* kDescription =
    "suid: validate and format Swiss business identification numbers (UID, eCH-0097)\n"
    "Checks syntax and the modulo-11 check digit only; registry status is not queried.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = warnings, 1 = debug, 2+ = trace
    bool quiet = false;
    std::string logLevel;  // Overrides -v/-q when set
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Check Command Options
// =============================================================================

struct CliCheckOptions {
    std::vector<std::string> uids;
    std::string input;       // File with one UID per line, '-' for stdin
    bool failFast = false;   // Stop on first invalid UID
};

CliCheckOptions gCheckOpts;

// =============================================================================
// Format Command Options
// =============================================================================

struct CliFormatOptions {
    std::string uid;
    std::string style = "plain";
};

CliFormatOptions gFormatOpts;

// =============================================================================
// Generate Command Options
// =============================================================================

struct CliGenerateOptions {
    std::uint64_t count = 1;
    std::uint64_t seed = 0;
    std::string prefix = "CHE";
    std::string style = "plain";
};

CliGenerateOptions gGenerateOpts;
CLI::Option* gSeedOption = nullptr;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCheckCommand(CLI::App& app) {
    auto* check = app.add_subcommand("check", "Validate UIDs");
    check->alias("c");

    check->add_option("uids", gCheckOpts.uids, "UIDs to validate, e.g. CHE-109.322.551");

    check->add_option("-i,--input", gCheckOpts.input,
                      "File with one UID per line (or '-' for stdin)")
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    check->add_flag("--fail-fast", gCheckOpts.failFast, "Stop at the first invalid UID");
}

void setupFormatCommand(CLI::App& app) {
    auto* format = app.add_subcommand("format", "Render a UID in a standard form");
    format->alias("f");

    format->add_option("uid", gFormatOpts.uid, "UID to render")->required();

    format->add_option("-s,--style", gFormatOpts.style, "Rendering: plain, hr, mwst, debug")
        ->default_val("plain")
        ->check(CLI::IsMember({"plain", "hr", "mwst", "debug"}, CLI::ignore_case));
}

void setupGenerateCommand(CLI::App& app) {
    auto* generate = app.add_subcommand("generate", "Generate random valid UIDs");
    generate->alias("g");

    generate->add_option("-n,--count", gGenerateOpts.count, "Number of UIDs")
        ->default_val(1)
        ->check(CLI::PositiveNumber);

    gSeedOption = generate->add_option("--seed", gGenerateOpts.seed,
                                       "RNG seed for reproducible output");

    generate->add_option("--prefix", gGenerateOpts.prefix, "Register prefix: CHE, ADM")
        ->default_val("CHE")
        ->check(CLI::IsMember({"CHE", "ADM"}, CLI::ignore_case));

    generate->add_option("-s,--style", gGenerateOpts.style, "Rendering: plain, hr, mwst, debug")
        ->default_val("plain")
        ->check(CLI::IsMember({"plain", "hr", "mwst", "debug"}, CLI::ignore_case));
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error log output");

    app.add_option("--log-level", gOptions.logLevel, "Explicit log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "critical"},
                              CLI::ignore_case));

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupCheckCommand(app);
    setupFormatCommand(app);
    setupGenerateCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        suid::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = suid::log::levelForVerbosity(gOptions.verbosity, gOptions.quiet);
        if (auto explicitLevel = suid::log::levelFromString(gOptions.logLevel)) {
            logConfig.level = *explicitLevel;
        }
        suid::log::init(logConfig);
        SUID_LOG_DEBUG("Log level {}", suid::log::levelToString(logConfig.level));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("check")) {
            exitCode = suid::commands::runCheck(app.get_subcommand("check"));
        } else if (app.got_subcommand("format")) {
            exitCode = suid::commands::runFormat(app.get_subcommand("format"));
        } else if (app.got_subcommand("generate")) {
            exitCode = suid::commands::runGenerate(app.get_subcommand("generate"));
        }
    } catch (const suid::SuidException& ex) {
        SUID_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        SUID_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    suid::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace suid::commands {

int runCheck([[maybe_unused]] CLI::App* app) {
    auto cmd = createCheckCommand(gCheckOpts.uids, gCheckOpts.input, gCheckOpts.failFast);
    return cmd->execute();
}

int runFormat([[maybe_unused]] CLI::App* app) {
    auto cmd = createFormatCommand(gFormatOpts.uid, gFormatOpts.style);
    return cmd->execute();
}

int runGenerate([[maybe_unused]] CLI::App* app) {
    auto cmd = createGenerateCommand(gGenerateOpts.count, gSeedOption->count() > 0,
                                     gGenerateOpts.seed, gGenerateOpts.prefix,
                                     gGenerateOpts.style);
    return cmd->execute();
}

}  // namespace suid::commands
