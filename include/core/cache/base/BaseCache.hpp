#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <optional>

namespace homebook {
namespace core {

/**
 * @brief Базовый шаблонный интерфейс уровня кэша (память, файлы).
 * @tparam Key Тип ключа (например, std::string)
 * @tparam Value Тип значения (например, cache::CacheEntry)
 */
template<typename Key, typename Value>
class BaseCache {
public:
    virtual ~BaseCache() = default;
    /// Получить значение по ключу. Возвращает std::optional<Value>.
    virtual std::optional<Value> get(const Key& key) = 0;
    /// Сохранить значение по ключу. false, если запись не удалась.
    virtual bool put(const Key& key, const Value& value) = 0;
    /// Удалить значение по ключу. true, если значение было.
    virtual bool remove(const Key& key) = 0;
    /// Очистить уровень полностью, вернуть кол-во удалённых записей.
    virtual size_t clear() = 0;
    /// Получить количество элементов.
    virtual size_t size() const = 0;
};

} // namespace core
} // namespace homebook
