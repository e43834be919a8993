/// @file log.cpp
/// @brief Named spdlog loggers over one shared console and rotating file sink set

#include <tonic/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <map>
#include <mutex>
#include <system_error>
#include <vector>

namespace tonic_core {

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::optional<std::filesystem::path> file_path;
    bool sinks_built = false;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Caller holds the registry mutex
void rebuild_sinks(LoggerRegistry& reg) {
    reg.sinks.clear();
    reg.file_path.reset();

    if (reg.config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        reg.sinks.push_back(console);
    }

    if (reg.config.file_enabled) {
        if (reg.config.log_directory.empty()) {
            spdlog::warn("File logging needs a log directory; console only");
        } else {
            std::filesystem::path dir(reg.config.log_directory);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            std::filesystem::path path = dir / reg.config.file_name;
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), reg.config.max_file_size, reg.config.max_files);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
                reg.sinks.push_back(file);
                reg.file_path = path;
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("Cannot open log file {}: {}", path.string(), e.what());
            }
        }
    }

    reg.sinks_built = true;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    rebuild_sinks(reg);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        logger->sinks() = reg.sinks;
        logger->set_level(config.level);
    }
    // The TONIC_LOG_* macros write through the default logger
    if (auto fallback = spdlog::default_logger()) {
        fallback->flush();
        fallback->sinks() = reg.sinks;
    }
    spdlog::set_level(config.level);
}

std::optional<std::filesystem::path> log_file_path() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.file_path;
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    if (!reg.sinks_built) {
        rebuild_sinks(reg);
    }

    // Registered elsewhere: adopt it onto the shared sinks
    if (auto existing = spdlog::get(name)) {
        existing->sinks() = reg.sinks;
        existing->set_level(reg.config.level);
        reg.loggers[name] = existing;
        return existing;
    }

    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(reg.config.level);
    reg.loggers[name] = logger;
    spdlog::register_logger(logger);
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.level = level;
    spdlog::set_level(level);
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    if (auto fallback = spdlog::default_logger()) {
        fallback->flush();
    }
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
    reg.sinks.clear();
    reg.file_path.reset();
    reg.sinks_built = false;

    spdlog::shutdown();
}

} // namespace tonic_core
