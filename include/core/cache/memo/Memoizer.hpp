#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "core/cache/manager/CacheManager.hpp"
#include "core/cache/key/KeyDeriver.hpp"

namespace homebook {
namespace core {
namespace cache {

/**
 * @brief Memoizer: "вычислить, только если нет в кэше" поверх CacheManager.
 * @details Ключ = KeyDeriver(prefix, keyParams). При промахе вызывается генератор,
 * результат сохраняется с метаданными {"params": keyParams}.
 *
 * Без single-flight: параллельные промахи по одному ключу могут вызвать
 * генератор несколько раз, побеждает последняя запись. Генераторы должны
 * быть детерминированными для одинаковых keyParams.
 *
 * Исключение генератора пробрасывается без изменений, в кэш ничего не пишется.
 * Отмены и таймаутов нет: при необходимости оборачивайте генератор сами.
 */
class Memoizer {
public:
    using Ttl = CacheManager::Ttl;
    using Generator = std::function<CacheValue()>;
    using AsyncGenerator = std::function<std::future<CacheValue>()>;

    explicit Memoizer(CacheManager& cache);

    // Блокирующий вариант
    CacheValue getOrGenerate(const std::string& prefix, const Generator& generator,
                             std::optional<Ttl> ttl, const KeyParams& keyParams);

    /**
     * @brief Неблокирующий вариант: поиск идёт на пуле кэша, ожидание генерации
     * и запись на отдельном потоке, так что медленный генератор не занимает воркер.
     * @note Memoizer можно уничтожить до завершения future, CacheManager нельзя.
     * Деструктор возвращённого future ждёт окончания генерации.
     */
    std::future<CacheValue> getOrGenerateAsync(const std::string& prefix, AsyncGenerator generator,
                                               std::optional<Ttl> ttl, KeyParams keyParams);

    // Типизированный вариант: T конвертируется через to_json/from_json
    template<typename T, typename F>
    T getOrGenerateAs(const std::string& prefix, F&& generator,
                      std::optional<Ttl> ttl, const KeyParams& keyParams) {
        CacheValue value = getOrGenerate(prefix, [&generator]() {
            return CacheValue(generator());
        }, ttl, keyParams);
        return value.template get<T>();
    }

    std::string keyFor(const std::string& prefix, const KeyParams& keyParams) const;
    CacheManager& cache();

private:
    CacheManager& cache_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace core
} // namespace homebook
