#include "core/cache/memo/Memoizer.hpp"
#include "core/logging/Logging.hpp"
#include <stdexcept>

namespace homebook {
namespace core {
namespace cache {

namespace {

nlohmann::json paramsMetadata(const KeyParams& keyParams) {
    nlohmann::json params = nlohmann::json::object();
    for (const auto& [name, param] : keyParams) {
        params[name] = param;
    }
    nlohmann::json metadata = {{"params", params}};
    return metadata;
}

} // namespace

Memoizer::Memoizer(CacheManager& cache)
    : cache_(cache), logger_(logging::getLogger("memoizer")) {
}

CacheValue Memoizer::getOrGenerate(const std::string& prefix, const Generator& generator,
                                   std::optional<Ttl> ttl, const KeyParams& keyParams) {
    if (!generator) {
        throw std::invalid_argument("getOrGenerate requires a generator");
    }
    const std::string key = keyFor(prefix, keyParams);
    if (auto cached = cache_.get(key)) {
        return *cached;
    }

    logger_->debug("Generating value for {}", key);
    CacheValue value = generator();
    cache_.set(key, value, ttl, paramsMetadata(keyParams));
    return value;
}

std::future<CacheValue> Memoizer::getOrGenerateAsync(const std::string& prefix, AsyncGenerator generator,
                                                     std::optional<Ttl> ttl, KeyParams keyParams) {
    if (!generator) {
        throw std::invalid_argument("getOrGenerateAsync requires a generator");
    }
    // Задача не ссылается на Memoizer: он может быть уничтожен раньше неё
    CacheManager& cache = cache_;
    std::shared_ptr<spdlog::logger> logger = logger_;
    std::string key = KeyDeriver::key(prefix, keyParams);
    std::future<std::optional<CacheValue>> lookup = cache.getAsync(key);

    // Генерация ожидается на отдельном потоке, воркеры пула не блокируются
    return std::async(std::launch::async,
        [&cache, logger, key = std::move(key), lookup = std::move(lookup),
         generator = std::move(generator), ttl, keyParams = std::move(keyParams)]() mutable {
            if (auto cached = lookup.get()) {
                return *cached;
            }

            logger->debug("Generating value asynchronously for {}", key);
            CacheValue value = generator().get();
            cache.set(key, value, ttl, paramsMetadata(keyParams));
            return value;
        });
}

std::string Memoizer::keyFor(const std::string& prefix, const KeyParams& keyParams) const {
    return KeyDeriver::key(prefix, keyParams);
}

CacheManager& Memoizer::cache() {
    return cache_;
}

} // namespace cache
} // namespace core
} // namespace homebook
