// =============================================================================
// swiss-uid - Format Command Implementation
// =============================================================================

#include "format_command.h"

#include <iostream>

#include "suid/common/logger.h"
#include "suid/uid/swiss_uid.h"

namespace suid::commands {

FormatCommand::FormatCommand(FormatOptions options) : options_(std::move(options)) {}

FormatCommand::~FormatCommand() = default;

FormatCommand::FormatCommand(FormatCommand&&) noexcept = default;
FormatCommand& FormatCommand::operator=(FormatCommand&&) noexcept = default;

int FormatCommand::execute() {
    try {
        const SwissUid uid = SwissUid::fromString(options_.uid);
        SUID_LOG_DEBUG("Rendering {} as {}", uid.toDebugString(), formatToString(options_.style));
        std::cout << uid.format(options_.style) << '\n';
        return 0;
    } catch (const SuidException& e) {
        SUID_LOG_ERROR("Format command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SUID_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

UidFormat parseStyle(const std::string& style) {
    const auto format = formatFromString(style);
    if (!format) {
        throw UsageError("Unknown style '" + style + "' (expected plain, hr, mwst or debug)");
    }
    return *format;
}

std::unique_ptr<FormatCommand> createFormatCommand(const std::string& uid,
                                                   const std::string& style) {
    FormatOptions opts;
    opts.uid = uid;
    opts.style = parseStyle(style);
    return std::make_unique<FormatCommand>(std::move(opts));
}

}  // namespace suid::commands
