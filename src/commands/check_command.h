// =============================================================================
// swiss-uid - Check Command
// =============================================================================
// Command handler for validating UIDs.
//
// This module provides:
// - CheckCommand: Validate UIDs given on the command line, in a file or stdin
// - One verdict line per UID and a summary
// =============================================================================

#ifndef SUID_COMMANDS_CHECK_COMMAND_H
#define SUID_COMMANDS_CHECK_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "suid/common/error.h"

namespace suid::commands {

// =============================================================================
// Check Options
// =============================================================================

/// @brief Configuration options for check command.
struct CheckOptions {
    /// @brief UIDs passed as positional arguments.
    std::vector<std::string> uids;

    /// @brief File with one UID per line ("-" for stdin, empty for none).
    std::filesystem::path inputPath;

    /// @brief Stop at the first invalid UID.
    bool failFast = false;
};

/// @brief Tally of a check run.
struct CheckSummary {
    std::uint64_t total = 0;
    std::uint64_t valid = 0;
    std::uint64_t invalid = 0;

    /// @brief Error code of the first rejected UID.
    ErrorCode firstError = ErrorCode::kSuccess;
};

// =============================================================================
// CheckCommand Class
// =============================================================================

/// @brief Command handler for validating UIDs.
class CheckCommand {
public:
    explicit CheckCommand(CheckOptions options);

    ~CheckCommand();

    // Non-copyable, movable
    CheckCommand(const CheckCommand&) = delete;
    CheckCommand& operator=(const CheckCommand&) = delete;
    CheckCommand(CheckCommand&&) noexcept;
    CheckCommand& operator=(CheckCommand&&) noexcept;

    /// @brief Execute the check command.
    /// @return 0 when every UID is valid, otherwise the exit code of the first error.
    [[nodiscard]] int execute();

    [[nodiscard]] const CheckOptions& options() const noexcept { return options_; }

    [[nodiscard]] const CheckSummary& summary() const noexcept { return summary_; }

private:
    /// @brief Check one entry and print its verdict.
    /// @return false if the entry was rejected.
    bool checkEntry(const std::string& text, std::uint64_t lineNumber);

    /// @brief Check every non-blank, non-comment line of a stream.
    void checkStream(std::istream& in);

    CheckOptions options_;
    CheckSummary summary_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a check command from CLI options.
[[nodiscard]] std::unique_ptr<CheckCommand> createCheckCommand(
    const std::vector<std::string>& uids,
    const std::string& inputPath,
    bool failFast);

}  // namespace suid::commands

#endif  // SUID_COMMANDS_CHECK_COMMAND_H
