#include "core/logging/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace homebook {
namespace core {
namespace logging {

namespace {
// spdlog::get + создание должны быть атомарны, иначе два потока зарегистрируют одно имя
std::mutex registryMutex;
}

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name, const LogConfig& config) {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }
    try {
        if (!config.logPath.empty()) {
            auto parent = std::filesystem::path(config.logPath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            logger = spdlog::rotating_logger_mt(name, config.logPath,
                                                config.maxLogSize, config.maxLogFiles);
        } else if (config.useStderr) {
            logger = spdlog::stderr_color_mt(name);
        } else {
            logger = spdlog::stdout_color_mt(name);
        }
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
        logger->set_level(parseLevel(config.level));
        return logger;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger '" << name << "': " << e.what() << std::endl;
        return spdlog::default_logger();
    }
}

} // namespace logging
} // namespace core
} // namespace homebook
