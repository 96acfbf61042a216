#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace homebook {
namespace core {
namespace cache {

// CacheStats: снимок статистики кэша для операционной поверхности
struct CacheStats {
    uint64_t memoryHits = 0;        // Попадания в память
    uint64_t fileHits = 0;          // Попадания в файлы
    uint64_t totalHits = 0;         // Всего попаданий
    uint64_t misses = 0;            // Промахи
    uint64_t totalRequests = 0;     // Всего запросов get
    double hitRate = 0.0;           // Процент попаданий, 2 знака
    uint64_t evictions = 0;         // Вытеснения LRU
    size_t memoryEntries = 0;       // Записей в памяти
    size_t fileEntries = 0;         // Файлов на момент вызова
    std::string cacheDir;           // Каталог файлового уровня

    nlohmann::json toJson() const {
        return {
            {"memory_hits", memoryHits},
            {"file_hits", fileHits},
            {"total_hits", totalHits},
            {"misses", misses},
            {"total_requests", totalRequests},
            {"hit_rate", hitRate},
            {"evictions", evictions},
            {"memory_entries", memoryEntries},
            {"file_entries", fileEntries},
            {"cache_dir", cacheDir}
        };
    }

    // Краткий формат {hits, misses, total, hit_rate} для старых потребителей
    nlohmann::json toLegacyJson() const {
        return {
            {"hits", totalHits},
            {"misses", misses},
            {"total", totalRequests},
            {"hit_rate", hitRate}
        };
    }
};

// StatsCollector: монотонные счётчики, сбрасываются только явным reset()
class StatsCollector {
public:
    void recordMemoryHit() { memoryHits_.fetch_add(1, std::memory_order_relaxed); }
    void recordFileHit() { fileHits_.fetch_add(1, std::memory_order_relaxed); }
    void recordMiss() { misses_.fetch_add(1, std::memory_order_relaxed); }
    void recordEviction() { evictions_.fetch_add(1, std::memory_order_relaxed); }

    // Счётчики запросов и вычисляемые поля; размеры уровней заполняет вызывающий
    CacheStats snapshot() const;
    void reset();

private:
    std::atomic<uint64_t> memoryHits_{0};
    std::atomic<uint64_t> fileHits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace cache
} // namespace core
} // namespace homebook
