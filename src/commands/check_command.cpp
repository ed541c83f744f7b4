// =============================================================================
// swiss-uid - Check Command Implementation
// =============================================================================

#include "check_command.h"

#include <fstream>
#include <iostream>
#include <string_view>
#include <system_error>

#include "suid/common/logger.h"
#include "suid/uid/swiss_uid.h"

namespace suid::commands {

namespace {

[[nodiscard]] bool isSkippableLine(std::string_view line) noexcept {
    const auto first = line.find_first_not_of(" \t\r");
    return first == std::string_view::npos || line[first] == '#';
}

}  // namespace

// =============================================================================
// CheckCommand Implementation
// =============================================================================

CheckCommand::CheckCommand(CheckOptions options) : options_(std::move(options)) {}

CheckCommand::~CheckCommand() = default;

CheckCommand::CheckCommand(CheckCommand&&) noexcept = default;
CheckCommand& CheckCommand::operator=(CheckCommand&&) noexcept = default;

int CheckCommand::execute() {
    try {
        if (options_.uids.empty() && options_.inputPath.empty()) {
            throw UsageError("No UIDs given: pass UIDs or --input");
        }

        summary_ = CheckSummary{};
        bool keepGoing = true;

        for (const auto& uid : options_.uids) {
            if (!checkEntry(uid, 0) && options_.failFast) {
                keepGoing = false;
                break;
            }
        }

        if (keepGoing && !options_.inputPath.empty()) {
            if (options_.inputPath == "-") {
                SUID_LOG_DEBUG("Reading UIDs from stdin");
                checkStream(std::cin);
            } else {
                std::error_code ec;
                if (!std::filesystem::exists(options_.inputPath, ec)) {
                    throw IOError("Input file not found: " + options_.inputPath.string(),
                                  ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
                }
                std::ifstream file(options_.inputPath);
                if (!file) {
                    throw IOError("Failed to open file: " + options_.inputPath.string());
                }
                SUID_LOG_DEBUG("Reading UIDs from {}", options_.inputPath.string());
                checkStream(file);
                if (file.bad()) {
                    throw IOError("Failed to read file: " + options_.inputPath.string());
                }
            }
        }

        SUID_LOG_INFO("Checked {} UID(s): {} valid, {} invalid", summary_.total, summary_.valid,
                      summary_.invalid);

        return toExitCode(summary_.firstError);

    } catch (const SuidException& e) {
        SUID_LOG_ERROR("Check command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SUID_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

bool CheckCommand::checkEntry(const std::string& text, std::uint64_t lineNumber) {
    ++summary_.total;

    auto result = SwissUid::parse(text);
    if (result) {
        ++summary_.valid;
        std::cout << "OK  " << *result << '\n';
        return true;
    }

    ++summary_.invalid;
    if (summary_.firstError == ErrorCode::kSuccess) {
        summary_.firstError = result.error().code();
    }

    std::cout << "ERR " << text << ": [" << errorCodeToString(result.error().code()) << "] "
              << result.error().message() << '\n';
    ErrorContext context{text};
    if (lineNumber > 0) {
        context.withLine(lineNumber);
    }
    SUID_LOG_DEBUG("Rejected {}", context.format());
    return false;
}

void CheckCommand::checkStream(std::istream& in) {
    std::string line;
    std::uint64_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (isSkippableLine(line)) {
            continue;
        }
        if (!checkEntry(line, lineNumber) && options_.failFast) {
            SUID_LOG_DEBUG("Stopping at line {} (fail-fast)", lineNumber);
            return;
        }
    }
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<CheckCommand> createCheckCommand(
    const std::vector<std::string>& uids,
    const std::string& inputPath,
    bool failFast) {
    CheckOptions opts;
    opts.uids = uids;
    opts.inputPath = inputPath;
    opts.failFast = failFast;
    return std::make_unique<CheckCommand>(std::move(opts));
}

}  // namespace suid::commands
