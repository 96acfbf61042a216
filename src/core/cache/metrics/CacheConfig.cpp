#include "core/cache/metrics/CacheConfig.hpp"
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace homebook {
namespace core {
namespace cache {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

// Целое из окружения в диапазоне [1, maxValue]; иначе nullopt и предупреждение
std::optional<long long> readPositiveEnv(const char* name, long long maxValue) {
    auto raw = readEnv(name);
    if (!raw) return std::nullopt;
    try {
        size_t pos = 0;
        long long parsed = std::stoll(*raw, &pos);
        if (pos != raw->size() || parsed <= 0) {
            throw std::invalid_argument("not a positive integer");
        }
        if (parsed > maxValue) {
            throw std::out_of_range("exceeds " + std::to_string(maxValue));
        }
        return parsed;
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring {}='{}': {}", name, *raw, e.what());
        return std::nullopt;
    }
}

} // namespace

CacheConfig CacheConfig::fromEnvironment() {
    CacheConfig config;
    if (auto dir = readEnv("CACHE_DIR")) {
        config.cacheDir = *dir;
    }
    constexpr long long kMaxTtlDays = ExpirationPolicy::kMaxTtl.count() / 24;
    if (auto days = readPositiveEnv("LLM_CACHE_TTL_DAYS", kMaxTtlDays)) {
        config.defaultTtl = std::chrono::hours(24 * *days);
    }
    if (auto entries = readPositiveEnv("CACHE_MAX_MEMORY_ENTRIES", std::numeric_limits<long long>::max())) {
        config.maxMemoryEntries = static_cast<size_t>(*entries);
    }
    if (auto logPath = readEnv("CACHE_LOG_PATH")) {
        config.log.logPath = *logPath;
    }
    if (auto level = readEnv("CACHE_LOG_LEVEL")) {
        config.log.level = *level;
    }
    return config;
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    return fromJson(j, CacheConfig{});
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j, const CacheConfig& base) {
    CacheConfig config = base;
    config.cacheDir = j.value("cacheDir", base.cacheDir);
    config.defaultTtl = std::chrono::seconds(j.value("defaultTtlSeconds", static_cast<int64_t>(base.defaultTtl.count())));
    config.maxMemoryEntries = j.value("maxMemoryEntries", base.maxMemoryEntries);
    config.workerThreads = j.value("workerThreads", base.workerThreads);
    config.queueSize = j.value("queueSize", base.queueSize);
    if (j.contains("log") && j["log"].is_object()) {
        const auto& log = j["log"];
        config.log.logPath = log.value("path", base.log.logPath);
        config.log.maxLogSize = log.value("maxSize", base.log.maxLogSize);
        config.log.maxLogFiles = log.value("maxFiles", base.log.maxLogFiles);
        config.log.level = log.value("level", base.log.level);
    }
    return config;
}

nlohmann::json CacheConfig::toJson() const {
    return {
        {"cacheDir", cacheDir},
        {"defaultTtlSeconds", defaultTtl.count()},
        {"maxMemoryEntries", maxMemoryEntries},
        {"workerThreads", workerThreads},
        {"queueSize", queueSize},
        {"log", {
            {"path", log.logPath},
            {"maxSize", log.maxLogSize},
            {"maxFiles", log.maxLogFiles},
            {"level", log.level}
        }}
    };
}

} // namespace cache
} // namespace core
} // namespace homebook
