// =============================================================================
// swiss-uid - Logger Module Implementation
// =============================================================================

#include "suid/common/logger.h"

#include "suid/common/types.h"

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace suid::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gInitMutex;

struct LevelName {
    std::string_view name;
    Level level;
};

constexpr std::array<LevelName, 8> kLevelNames = {{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

std::shared_ptr<quill::Sink> makeConsoleSink(const std::string& stream) {
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console_" + stream, true,
                                                                   stream);
}

std::shared_ptr<quill::Sink> makeFileSink(const std::string& path, bool append) {
    quill::FileSinkConfig fileConfig;
    fileConfig.set_open_mode(append ? 'a' : 'w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Level Selection
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Warning;
}

std::optional<Level> levelFromString(std::string_view name) noexcept {
    for (const auto& entry : kLevelNames) {
        if (equalsIgnoreCase(name, entry.name)) {
            return entry.level;
        }
    }
    return std::nullopt;
}

std::string_view levelToString(Level level) noexcept {
    // First match is the canonical name
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "warning";
}

Level levelForVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    if (verbosity == 1) {
        return Level::kDebug;
    }
    return Level::kWarning;
}

// =============================================================================
// Initialization
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(makeConsoleSink(config.consoleStream));
    }
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile, config.appendToFile));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(config.loggerName,
                                                                   std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* current = logger(); current != nullptr) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (!isInitialized()) {
        return;
    }
    flush();
    quill::Backend::stop();
    gLogger.store(nullptr, std::memory_order_release);
}

}  // namespace suid::log
