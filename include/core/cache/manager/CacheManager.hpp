#pragma once

#include <memory>
#include <string>
#include <optional>
#include <future>
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/cache/metrics/CacheStats.hpp"
#include "core/cache/entry/CacheEntry.hpp"
#include "core/thread/ThreadPool.hpp"

namespace homebook {
namespace core {
namespace cache {

/**
 * @brief Фасад двухуровневого кэша генераций (память + файлы).
 * @details Единственная точка входа для потребителей. Создаётся один раз
 * хостом и передаётся по ссылке; для "сброса" создаётся новый экземпляр.
 * Файловый уровень работает по принципу best-effort: ошибки записи
 * логируются, а корректность внутри процесса обеспечивает уровень памяти.
 */
class CacheManager {
public:
    using Ttl = std::chrono::milliseconds;

    // std::invalid_argument при некорректной конфигурации
    explicit CacheManager(const CacheConfig& config = CacheConfig{});

    // Деструктор (выполняет shutdown)
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    // Память, затем файлы с продвижением в память; пусто при промахе
    std::optional<CacheValue> get(const std::string& key);

    // expires_at вычисляется один раз и одинаков для обоих уровней
    void set(const std::string& key, const CacheValue& value,
             std::optional<Ttl> ttl = std::nullopt,
             const nlohmann::json& metadata = nlohmann::json::object());

    // Идемпотентное удаление из обоих уровней
    void invalidate(const std::string& key);

    // Удалить все ключи "{prefix}_*" в обоих уровнях
    size_t invalidatePrefix(const std::string& prefix);

    // Очистить оба уровня; результат приблизительный
    size_t clearAll();

    // Удалить истёкшие записи (и повреждённые файлы)
    size_t clearExpired();

    CacheStats getStats() const;
    void resetStats();

    // Асинхронные варианты; выполняются на пуле потоков менеджера
    std::future<std::optional<CacheValue>> getAsync(const std::string& key);
    std::future<void> setAsync(const std::string& key, const CacheValue& value,
                               std::optional<Ttl> ttl = std::nullopt,
                               const nlohmann::json& metadata = nlohmann::json::object());
    std::future<size_t> clearExpiredAsync();

    CacheConfig getConfiguration() const;
    bool isFileTierAvailable() const;
    size_t memoryEntryCount() const;
    bool inMemory(const std::string& key) const; // Без обновления давности
    thread::ThreadPool& threadPool();

    // Дождаться фоновых задач и сбросить логи
    void shutdown();

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace core
} // namespace homebook
