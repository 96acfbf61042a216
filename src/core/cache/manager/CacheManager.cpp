#include "core/cache/manager/CacheManager.hpp"
#include "core/cache/tier/MemoryTier.hpp"
#include "core/cache/tier/FileTier.hpp"
#include "core/cache/policy/ExpirationPolicy.hpp"
#include "core/logging/Logging.hpp"
#include <atomic>
#include <initializer_list>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace homebook {
namespace core {
namespace cache {

namespace {

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

const CacheConfig& validated(const CacheConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid cache configuration");
    }
    return config;
}

// Логгеры компонентов создаются с общей конфигурацией до самих компонентов
std::shared_ptr<spdlog::logger> initLoggers(const logging::LogConfig& log) {
    for (const char* name : {"memorytier", "filetier", "threadpool", "memoizer"}) {
        logging::getLogger(name, log);
    }
    return logging::getLogger("cachemanager", log);
}

thread::ThreadPoolConfig poolConfig(const CacheConfig& config) {
    thread::ThreadPoolConfig pool;
    pool.minThreads = config.workerThreads;
    pool.maxThreads = config.workerThreads;
    pool.queueSize = config.queueSize;
    return pool;
}

} // namespace

// Реализация PIMPL
struct CacheManager::Impl {
    CacheConfig config;                     // Конфигурация кэша
    std::shared_ptr<spdlog::logger> logger;
    StatsCollector stats;                   // Счётчики попаданий/промахов
    EntryMemoryTier memory;                 // Уровень памяти (LRU)
    FileTier files;                         // Файловый уровень
    thread::ThreadPool pool;                // Пул для асинхронных операций
    std::atomic<bool> shutDown{false};

    explicit Impl(const CacheConfig& cfg)
        : config(validated(cfg))
        , logger(initLoggers(cfg.log))
        , memory(cfg.maxMemoryEntries)
        , files(cfg.cacheDir)
        , pool(poolConfig(cfg)) {
        memory.setEvictionCallback([this](const std::string&, const CacheEntry&) {
            stats.recordEviction();
        });
        if (!files.available()) {
            logger->warn("File tier unavailable at {}, running memory-only", cfg.cacheDir);
        }
        logger->info("CacheManager initialized: dir={}, defaultTtl={}s, maxMemoryEntries={}",
                     cfg.cacheDir, cfg.defaultTtl.count(), cfg.maxMemoryEntries);
    }
};

// Конструктор
CacheManager::CacheManager(const CacheConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
}

// Деструктор
CacheManager::~CacheManager() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        spdlog::error("CacheManager shutdown failed: {}", e.what());
    }
}

std::optional<CacheValue> CacheManager::get(const std::string& key) {
    const auto now = ExpirationPolicy::now();

    // Уровень памяти
    if (auto entry = pImpl->memory.get(key)) {
        if (!entry->isExpired(now)) {
            pImpl->stats.recordMemoryHit();
            pImpl->logger->debug("Memory cache hit: {}", key);
            return entry->value;
        }
        // Удаляем только ту же истёкшую запись, а не свежую от параллельного set
        pImpl->memory.removeIf(key, [now](const CacheEntry& current) {
            return current.isExpired(now);
        });
    }

    // Файловый уровень (истёкшие и повреждённые файлы он удаляет сам)
    if (auto entry = pImpl->files.get(key, now)) {
        pImpl->stats.recordFileHit();
        pImpl->logger->debug("File cache hit: {}", key);
        CacheValue value = entry->value;
        // Промоушен не перетирает более новую запись в памяти
        const Timestamp loadedAt = entry->createdAt;
        pImpl->memory.putIf(key, *entry, [now, loadedAt](const CacheEntry& current) {
            return current.createdAt < loadedAt || current.isExpired(now);
        });
        return value;
    }

    pImpl->stats.recordMiss();
    pImpl->logger->debug("Cache miss: {}", key);
    return std::nullopt;
}

void CacheManager::set(const std::string& key, const CacheValue& value,
                       std::optional<Ttl> ttl, const nlohmann::json& metadata) {
    const Ttl effectiveTtl = ttl.value_or(std::chrono::duration_cast<Ttl>(pImpl->config.defaultTtl));
    const auto now = ExpirationPolicy::now();

    CacheEntry entry;
    entry.value = value;
    entry.createdAt = now;
    entry.expiresAt = ExpirationPolicy::expiresAfter(now, effectiveTtl);
    entry.cacheKey = key;
    if (metadata.is_object()) {
        entry.metadata = metadata;
    } else if (!metadata.is_null()) {
        entry.metadata = {{"metadata", metadata}};
    }

    pImpl->memory.put(key, entry);
    if (pImpl->files.put(key, entry)) {
        pImpl->logger->debug("Cached value for: {} (TTL: {}ms)", key, effectiveTtl.count());
    } else {
        pImpl->logger->debug("Cached value for: {} in memory only", key);
    }
}

void CacheManager::invalidate(const std::string& key) {
    pImpl->memory.remove(key);
    pImpl->files.remove(key);
    pImpl->logger->debug("Invalidated cache entry: {}", key);
}

size_t CacheManager::invalidatePrefix(const std::string& prefix) {
    const std::string keyPrefix = prefix + "_";
    size_t count = pImpl->memory.removeIf([&keyPrefix](const std::string& key, const CacheEntry&) {
        return startsWith(key, keyPrefix);
    }).size();
    count += pImpl->files.removeByPrefix(prefix);

    pImpl->logger->info("Invalidated {} cache entries with prefix: {}", count, prefix);
    return count;
}

size_t CacheManager::clearAll() {
    size_t count = pImpl->memory.clear();
    count += pImpl->files.clear();
    pImpl->logger->info("Cleared {} cache entries", count);
    return count;
}

size_t CacheManager::clearExpired() {
    const auto now = ExpirationPolicy::now();
    size_t count = pImpl->memory.removeIf([now](const std::string&, const CacheEntry& entry) {
        return entry.isExpired(now);
    }).size();
    count += pImpl->files.sweepExpired(now);

    if (count > 0) {
        pImpl->logger->info("Cleared {} expired cache entries", count);
    }
    return count;
}

CacheStats CacheManager::getStats() const {
    CacheStats stats = pImpl->stats.snapshot();
    stats.memoryEntries = pImpl->memory.size();
    stats.fileEntries = pImpl->files.size();
    stats.cacheDir = pImpl->config.cacheDir;
    return stats;
}

void CacheManager::resetStats() {
    pImpl->stats.reset();
}

std::future<std::optional<CacheValue>> CacheManager::getAsync(const std::string& key) {
    return pImpl->pool.submit([this, key]() {
        return get(key);
    });
}

std::future<void> CacheManager::setAsync(const std::string& key, const CacheValue& value,
                                         std::optional<Ttl> ttl, const nlohmann::json& metadata) {
    return pImpl->pool.submit([this, key, value, ttl, metadata]() {
        set(key, value, ttl, metadata);
    });
}

std::future<size_t> CacheManager::clearExpiredAsync() {
    return pImpl->pool.submit([this]() {
        return clearExpired();
    });
}

CacheConfig CacheManager::getConfiguration() const {
    return pImpl->config;
}

bool CacheManager::isFileTierAvailable() const {
    return pImpl->files.available();
}

size_t CacheManager::memoryEntryCount() const {
    return pImpl->memory.size();
}

bool CacheManager::inMemory(const std::string& key) const {
    return pImpl->memory.contains(key);
}

thread::ThreadPool& CacheManager::threadPool() {
    return pImpl->pool;
}

void CacheManager::shutdown() {
    if (pImpl->shutDown.exchange(true)) {
        return;
    }
    pImpl->pool.stop();
    pImpl->logger->info("CacheManager shut down");
    pImpl->logger->flush();
}

} // namespace cache
} // namespace core
} // namespace homebook
