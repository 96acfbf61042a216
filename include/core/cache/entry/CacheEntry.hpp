#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/cache/policy/ExpirationPolicy.hpp"

namespace homebook {
namespace core {
namespace cache {

// Полезная нагрузка кэша: null | bool | number | string | array | object
using CacheValue = nlohmann::json;

/**
 * @brief Запись кэша. Неизменяема после записи: повторный set заменяет её целиком.
 * @details metadata хранит объект строковых ключей, при сериализации поля
 * выносятся на верхний уровень файла рядом с зарезервированными.
 */
struct CacheEntry {
    CacheValue value;
    Timestamp expiresAt;
    Timestamp createdAt;
    std::string cacheKey;
    nlohmann::json metadata = nlohmann::json::object();

    bool isExpired(Timestamp now) const {
        return ExpirationPolicy::isExpired(expiresAt, now);
    }

    // Сериализация в JSON (формат файла на диске)
    nlohmann::json toJson() const;

    /**
     * @brief Десериализация из JSON.
     * @throws std::invalid_argument если j не объект или время вне диапазона часов
     * @throws nlohmann::json::exception если нет value или поля неверного типа
     */
    static CacheEntry fromJson(const nlohmann::json& j);
};

} // namespace cache
} // namespace core
} // namespace homebook
