#pragma once

#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "core/cache/memo/Memoizer.hpp"
#include "core/cache/key/KeyDeriver.hpp"

namespace homebook {
namespace core {
namespace cache {

namespace detail {

template<typename T>
struct IsOptional : std::false_type {};

template<typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

// Пустой std::optional заменяется значением по умолчанию из defaults (или null)
template<typename T>
nlohmann::json boundValue(const std::string& name, const T& value, const KeyParams& defaults) {
    if constexpr (IsOptional<T>::value) {
        if (!value) {
            auto it = defaults.find(name);
            return it != defaults.end() ? it->second : nlohmann::json();
        }
        return toKeyValue(*value);
    } else {
        return toKeyValue(value);
    }
}

} // namespace detail

/**
 * @brief Извлекатель параметров ключа, связывающий имена с позиционными аргументами.
 * @param names имена параметров в порядке объявления (по одному на аргумент)
 * @param defaults значения для опущенных (пустых std::optional) аргументов
 * @param only если не пуст, в ключ попадают только эти имена
 * @throws std::invalid_argument если число имён не совпадает с числом аргументов
 */
template<typename... Args>
std::function<KeyParams(const Args&...)> bindParams(std::vector<std::string> names,
                                                    KeyParams defaults = {},
                                                    std::set<std::string> only = {}) {
    if (names.size() != sizeof...(Args)) {
        throw std::invalid_argument("bindParams: expected " + std::to_string(sizeof...(Args)) +
                                    " parameter names, got " + std::to_string(names.size()));
    }
    return [names = std::move(names), defaults = std::move(defaults), only = std::move(only)](const Args&... args) {
        KeyParams params;
        size_t index = 0;
        auto bind = [&](const auto& value) {
            const std::string& name = names[index++];
            if (only.empty() || only.count(name) > 0) {
                params[name] = detail::boundValue(name, value, defaults);
            }
        };
        (bind(args), ...);
        return params;
    };
}

template<typename Signature>
class CachedCall;

/**
 * @brief Обёртка функции с мемоизацией результата в кэше.
 * @details Параметры ключа строит явный извлекатель (например, bindParams).
 * R должен конвертироваться в nlohmann::json и обратно.
 */
template<typename R, typename... Args>
class CachedCall<R(Args...)> {
public:
    using Ttl = Memoizer::Ttl;
    using Function = std::function<R(Args...)>;
    using KeyExtractor = std::function<KeyParams(const Args&...)>;

    CachedCall(Memoizer& memoizer, std::string prefix, Function function,
               KeyExtractor extractor, std::optional<Ttl> ttl = std::nullopt)
        : memoizer_(memoizer)
        , prefix_(std::move(prefix))
        , function_(std::move(function))
        , extractor_(std::move(extractor))
        , ttl_(ttl) {
        if (!function_ || !extractor_) {
            throw std::invalid_argument("CachedCall requires a function and a key extractor");
        }
    }

    R operator()(Args... args) const {
        KeyParams params = extractor_(args...);
        CacheValue value = memoizer_.getOrGenerate(prefix_, [&]() {
            return CacheValue(function_(args...));
        }, ttl_, params);
        return value.template get<R>();
    }

    // Ключ, под которым окажется результат вызова с этими аргументами
    std::string keyFor(const Args&... args) const {
        return memoizer_.keyFor(prefix_, extractor_(args...));
    }

    const std::string& prefix() const { return prefix_; }

private:
    Memoizer& memoizer_;
    std::string prefix_;
    Function function_;
    KeyExtractor extractor_;
    std::optional<Ttl> ttl_;
};

} // namespace cache
} // namespace core
} // namespace homebook
