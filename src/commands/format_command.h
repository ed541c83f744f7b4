// =============================================================================
// swiss-uid - Format Command
// =============================================================================
// Command handler for re-rendering a UID in one of its textual forms.
// =============================================================================

#ifndef SUID_COMMANDS_FORMAT_COMMAND_H
#define SUID_COMMANDS_FORMAT_COMMAND_H

#include <memory>
#include <string>

#include "suid/common/error.h"
#include "suid/common/types.h"

namespace suid::commands {

/// @brief Configuration options for format command.
struct FormatOptions {
    /// @brief UID to render.
    std::string uid;

    /// @brief Output rendering.
    UidFormat style = UidFormat::kPlain;
};

/// @brief Command handler for rendering a validated UID.
class FormatCommand {
public:
    explicit FormatCommand(FormatOptions options);

    ~FormatCommand();

    // Non-copyable, movable
    FormatCommand(const FormatCommand&) = delete;
    FormatCommand& operator=(const FormatCommand&) = delete;
    FormatCommand(FormatCommand&&) noexcept;
    FormatCommand& operator=(FormatCommand&&) noexcept;

    /// @brief Execute the format command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const FormatOptions& options() const noexcept { return options_; }

private:
    FormatOptions options_;
};

/// @brief Create a format command from CLI options.
/// @throws UsageError for an unknown style name.
[[nodiscard]] std::unique_ptr<FormatCommand> createFormatCommand(const std::string& uid,
                                                                 const std::string& style);

/// @brief Parse a style name.
/// @throws UsageError for an unknown style name.
[[nodiscard]] UidFormat parseStyle(const std::string& style);

}  // namespace suid::commands

#endif  // SUID_COMMANDS_FORMAT_COMMAND_H
