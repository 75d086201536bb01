// =============================================================================
// railmr - Logger Module Implementation
// =============================================================================

#include "railmr/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace railmr::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gInitMutex;

struct LevelName {
    std::string_view name;
    Level level;
};

constexpr std::array<LevelName, 8> kLevelNames{{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

quill::Logger* createLogger(const Config& config) {
    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode(config.appendToFile ? 'a' : 'w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }

    auto* created = quill::Frontend::create_or_get_logger(std::string(roleName(config.role)),
                                                          std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    return created;
}

}  // namespace

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
    return quill::LogLevel::Info;
}

std::optional<Level> parseLevel(std::string_view name) noexcept {
    for (const auto& entry : kLevelNames) {
        if (equalsIgnoreCase(entry.name, name)) {
            return entry.level;
        }
    }
    return std::nullopt;
}

Level levelFromString(std::string_view name) noexcept {
    return parseLevel(name).value_or(Level::kInfo);
}

std::string_view levelToString(Level level) noexcept {
    // First table entry per level is its canonical name.
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

Level levelFromVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

std::string_view roleName(Role role) noexcept {
    return role == Role::kWorker ? "worker" : "driver";
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }
    gLogger.store(createLogger(config), std::memory_order_release);
}

quill::Logger* logger() {
    quill::Logger* current = gLogger.load(std::memory_order_acquire);
    if (current == nullptr) {
        init(Config{});
        current = gLogger.load(std::memory_order_acquire);
    }
    return current;
}

bool isInitialized() noexcept {
    return gLogger.load(std::memory_order_acquire) != nullptr;
}

void setLevel(Level level) {
    if (auto* current = gLogger.load(std::memory_order_acquire)) {
        current->set_log_level(toQuillLevel(level));
    }
}

void flush() {
    if (auto* current = gLogger.load(std::memory_order_acquire)) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (auto* current = gLogger.exchange(nullptr, std::memory_order_acq_rel)) {
        current->flush_log();
        quill::Backend::stop();
    }
}

}  // namespace railmr::log
