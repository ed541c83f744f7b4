// =============================================================================
// swiss-uid - Generate Command
// =============================================================================
// Command handler for producing random valid UIDs, e.g. for test fixtures.
// A fixed seed makes the output reproducible.
// =============================================================================

#ifndef SUID_COMMANDS_GENERATE_COMMAND_H
#define SUID_COMMANDS_GENERATE_COMMAND_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "suid/common/error.h"
#include "suid/common/types.h"

namespace suid::commands {

/// @brief Configuration options for generate command.
struct GenerateOptions {
    /// @brief Number of UIDs to print.
    std::uint64_t count = 1;

    /// @brief RNG seed; random_device when unset.
    std::optional<std::uint64_t> seed;

    /// @brief Register prefix of the generated UIDs.
    UidPrefix prefix = UidPrefix::kCHE;

    /// @brief Output rendering.
    UidFormat style = UidFormat::kPlain;
};

/// @brief Command handler for generating UIDs.
class GenerateCommand {
public:
    explicit GenerateCommand(GenerateOptions options);

    ~GenerateCommand();

    // Non-copyable, movable
    GenerateCommand(const GenerateCommand&) = delete;
    GenerateCommand& operator=(const GenerateCommand&) = delete;
    GenerateCommand(GenerateCommand&&) noexcept;
    GenerateCommand& operator=(GenerateCommand&&) noexcept;

    /// @brief Execute the generate command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const GenerateOptions& options() const noexcept { return options_; }

private:
    GenerateOptions options_;
};

/// @brief Create a generate command from CLI options.
/// @param seed Seed value, ignored when hasSeed is false.
/// @throws UsageError for an unknown prefix or style.
[[nodiscard]] std::unique_ptr<GenerateCommand> createGenerateCommand(std::uint64_t count,
                                                                     bool hasSeed,
                                                                     std::uint64_t seed,
                                                                     const std::string& prefix,
                                                                     const std::string& style);

}  // namespace suid::commands

#endif  // SUID_COMMANDS_GENERATE_COMMAND_H
