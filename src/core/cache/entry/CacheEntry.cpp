#include "core/cache/entry/CacheEntry.hpp"
#include <array>
#include <stdexcept>

namespace homebook {
namespace core {
namespace cache {

namespace {
constexpr std::array<const char*, 4> kReservedFields = {"value", "expires_at", "created_at", "cache_key"};

bool isReserved(const std::string& field) {
    for (const char* reserved : kReservedFields) {
        if (field == reserved) return true;
    }
    return false;
}

Timestamp readTimestamp(const nlohmann::json& j, const char* field) {
    double seconds = j.value(field, 0.0);
    if (!ExpirationPolicy::isRepresentable(seconds)) {
        throw std::invalid_argument(std::string(field) + " is out of range");
    }
    return ExpirationPolicy::fromUnixSeconds(seconds);
}
} // namespace

nlohmann::json CacheEntry::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    // Метаданные не перекрывают зарезервированные поля
    if (metadata.is_object()) {
        for (const auto& [field, data] : metadata.items()) {
            if (!isReserved(field)) {
                j[field] = data;
            }
        }
    }
    j["value"] = value;
    j["expires_at"] = ExpirationPolicy::toUnixSeconds(expiresAt);
    j["created_at"] = ExpirationPolicy::toUnixSeconds(createdAt);
    j["cache_key"] = cacheKey;
    return j;
}

CacheEntry CacheEntry::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("cache entry must be a JSON object");
    }
    CacheEntry entry;
    entry.value = j.at("value");
    // Без expires_at запись считается давно истёкшей
    entry.expiresAt = readTimestamp(j, "expires_at");
    entry.createdAt = readTimestamp(j, "created_at");
    entry.cacheKey = j.value("cache_key", std::string());
    for (const auto& [field, data] : j.items()) {
        if (!isReserved(field)) {
            entry.metadata[field] = data;
        }
    }
    return entry;
}

} // namespace cache
} // namespace core
} // namespace homebook
