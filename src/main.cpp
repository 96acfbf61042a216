#include <iostream>
#include <fstream>
#include <cstdlib>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "core/cache/manager/CacheManager.hpp"
#include "core/cache/metrics/CacheConfig.hpp"

using namespace homebook::core;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void printUsage() {
    std::cerr <<
        "Usage: homebook-cache [--config <file.json>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  stats [--legacy]              Print cache statistics as JSON\n"
        "  config                        Print the effective configuration\n"
        "  get <key>                     Print the cached value (exit 1 on miss)\n"
        "  set <key> <json> [ttl-sec]    Store a JSON value\n"
        "  invalidate <key>              Remove one entry\n"
        "  invalidate-prefix <prefix>    Remove all entries \"<prefix>_*\"\n"
        "  clear-expired                 Remove expired and corrupt entries\n"
        "  clear-all                     Remove every entry\n"
        "\n"
        "Environment: CACHE_DIR, LLM_CACHE_TTL_DAYS, CACHE_MAX_MEMORY_ENTRIES,\n"
        "             CACHE_LOG_PATH, CACHE_LOG_LEVEL\n";
}

// Логи CLI идут в stderr, stdout остаётся для результата
void initializeLogging() {
    try {
        auto logger = spdlog::stderr_color_mt("homebook_cache");
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

cache::CacheConfig loadConfiguration(const std::optional<std::string>& configPath) {
    cache::CacheConfig config = cache::CacheConfig::fromEnvironment();
    if (std::getenv("CACHE_LOG_LEVEL") == nullptr) {
        config.log.level = "warn";
    }
    config.log.useStderr = true;
    if (configPath) {
        std::ifstream in(*configPath);
        if (!in) {
            throw std::runtime_error("Cannot open config file: " + *configPath);
        }
        config = cache::CacheConfig::fromJson(nlohmann::json::parse(in), config);
    }
    spdlog::set_level(logging::parseLevel(config.log.level));
    return config;
}

int runCommand(cache::CacheManager& manager, const std::vector<std::string>& args) {
    const std::string& command = args[0];
    auto requireArgs = [&args, &command](size_t count) {
        if (args.size() < count + 1) {
            throw std::invalid_argument("'" + command + "' expects " + std::to_string(count) + " argument(s)");
        }
    };

    if (command == "stats") {
        cache::CacheStats stats = manager.getStats();
        bool legacy = args.size() > 1 && args[1] == "--legacy";
        std::cout << (legacy ? stats.toLegacyJson() : stats.toJson()).dump(2) << std::endl;
    } else if (command == "config") {
        std::cout << manager.getConfiguration().toJson().dump(2) << std::endl;
    } else if (command == "get") {
        requireArgs(1);
        auto value = manager.get(args[1]);
        if (!value) {
            spdlog::info("Cache miss: {}", args[1]);
            return kExitError;
        }
        std::cout << value->dump(2) << std::endl;
    } else if (command == "set") {
        requireArgs(2);
        nlohmann::json value = nlohmann::json::parse(args[2]);
        std::optional<cache::CacheManager::Ttl> ttl;
        if (args.size() > 3) {
            ttl = std::chrono::duration_cast<cache::CacheManager::Ttl>(std::chrono::seconds(std::stoll(args[3])));
            if (ttl->count() <= 0) {
                throw std::invalid_argument("TTL must be positive");
            }
        }
        manager.set(args[1], value, ttl);
        if (!manager.isFileTierAvailable()) {
            spdlog::warn("File tier unavailable, value was not persisted");
            return kExitError;
        }
    } else if (command == "invalidate") {
        requireArgs(1);
        manager.invalidate(args[1]);
    } else if (command == "invalidate-prefix") {
        requireArgs(1);
        std::cout << manager.invalidatePrefix(args[1]) << std::endl;
    } else if (command == "clear-expired") {
        std::cout << manager.clearExpired() << std::endl;
    } else if (command == "clear-all") {
        std::cout << manager.clearAll() << std::endl;
    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        printUsage();
        return kExitUsage;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::optional<std::string> configPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        printUsage();
        return args.empty() ? kExitUsage : kExitOk;
    }

    try {
        initializeLogging();
        cache::CacheManager manager(loadConfiguration(configPath));
        int rc = runCommand(manager, args);
        manager.shutdown();
        return rc;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid JSON: {}", e.what());
        return kExitUsage;
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitError;
    }
}
