// =============================================================================
// swiss-uid - Generate Command Implementation
// =============================================================================

#include "generate_command.h"

#include <iostream>
#include <random>

#include "format_command.h"
#include "suid/common/logger.h"
#include "suid/uid/swiss_uid.h"

namespace suid::commands {

GenerateCommand::GenerateCommand(GenerateOptions options) : options_(std::move(options)) {}

GenerateCommand::~GenerateCommand() = default;

GenerateCommand::GenerateCommand(GenerateCommand&&) noexcept = default;
GenerateCommand& GenerateCommand::operator=(GenerateCommand&&) noexcept = default;

int GenerateCommand::execute() {
    try {
        const std::uint64_t seed = options_.seed.value_or(std::random_device{}());
        std::mt19937_64 rng(seed);
        SUID_LOG_DEBUG("Generating {} {} UID(s) with seed {}", options_.count,
                       prefixToString(options_.prefix), seed);

        for (std::uint64_t i = 0; i < options_.count; ++i) {
            const SwissUid uid = SwissUid::generate(rng, options_.prefix);
            std::cout << uid.format(options_.style) << '\n';
        }
        return 0;
    } catch (const SuidException& e) {
        SUID_LOG_ERROR("Generate command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SUID_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

std::unique_ptr<GenerateCommand> createGenerateCommand(std::uint64_t count,
                                                       bool hasSeed,
                                                       std::uint64_t seed,
                                                       const std::string& prefix,
                                                       const std::string& style) {
    GenerateOptions opts;
    opts.count = count;
    if (hasSeed) {
        opts.seed = seed;
    }
    const auto parsedPrefix = prefixFromString(prefix);
    if (!parsedPrefix) {
        throw UsageError("Unknown prefix '" + prefix + "' (expected CHE or ADM)");
    }
    opts.prefix = *parsedPrefix;
    opts.style = parseStyle(style);
    return std::make_unique<GenerateCommand>(std::move(opts));
}

}  // namespace suid::commands
