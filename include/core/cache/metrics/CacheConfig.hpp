#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/logging/Logging.hpp"
#include "core/cache/policy/ExpirationPolicy.hpp"

namespace homebook {
namespace core {
namespace cache {

// Унифицированная конфигурация кэша (задаётся один раз при создании CacheManager)
struct CacheConfig {
    std::string cacheDir = "/tmp/homebook_cache";         // Корень файлового уровня
    std::chrono::seconds defaultTtl = std::chrono::hours(24 * 7); // TTL по умолчанию (7 дней)
    size_t maxMemoryEntries = 1000;                       // Ёмкость уровня памяти (LRU)
    size_t workerThreads = 2;                             // Потоки для асинхронных операций
    size_t queueSize = 1024;                              // Макс. очередь асинхронных задач
    logging::LogConfig log;                               // Логирование компонентов

    bool validate() const {
        return !cacheDir.empty() && defaultTtl.count() > 0 && defaultTtl <= ExpirationPolicy::kMaxTtl &&
               maxMemoryEntries > 0 && workerThreads > 0 && queueSize > 0;
    }

    /**
     * @brief Конфигурация из переменных окружения поверх значений по умолчанию.
     * @details CACHE_DIR, LLM_CACHE_TTL_DAYS, CACHE_MAX_MEMORY_ENTRIES,
     * CACHE_LOG_PATH, CACHE_LOG_LEVEL. Некорректные или слишком большие числа
     * игнорируются с предупреждением.
     */
    static CacheConfig fromEnvironment();

    // Загрузка из JSON (отсутствующие поля берутся из base или значений по умолчанию)
    static CacheConfig fromJson(const nlohmann::json& j);
    static CacheConfig fromJson(const nlohmann::json& j, const CacheConfig& base);
    nlohmann::json toJson() const;
};

} // namespace cache
} // namespace core
} // namespace homebook
