#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include "core/cache/key/KeyDeriver.hpp"
#include "core/cache/entry/CacheEntry.hpp"

using namespace homebook::core::cache;

namespace {

struct Room {
    std::string name;
};

std::ostream& operator<<(std::ostream& os, const Room& room) {
    return os << "Room(" << room.name << ")";
}

bool isHex(const std::string& s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

} // namespace

void smokeTestKeyFormat() {
    std::string key = KeyDeriver::key("narrative", {{"home_id", 42}, {"style", "cozy"}});
    assert(key.rfind("narrative_", 0) == 0);
    std::string digest = key.substr(std::string("narrative_").size());
    assert(digest.size() == KeyDeriver::kDigestLength);
    assert(isHex(digest));
    std::cout << "[OK] KeyDeriver key format\n";
}

void smokeTestKeyDeterminism() {
    KeyParams a;
    a["style"] = "cozy";
    a["home_id"] = 42;
    a["rooms"] = nlohmann::json::array({"kitchen", "den"});

    KeyParams b;
    b["rooms"] = nlohmann::json::array({"kitchen", "den"});
    b["home_id"] = 42;
    b["style"] = "cozy";

    assert(KeyDeriver::key("p", a) == KeyDeriver::key("p", b));
    assert(KeyDeriver::key("p", a) == KeyDeriver::key("p", a));

    // Вложенные объекты с разным порядком вставки
    KeyParams c{{"opts", nlohmann::json{{"x", 1}, {"y", 2}}}};
    KeyParams d{{"opts", nlohmann::json{{"y", 2}, {"x", 1}}}};
    assert(KeyDeriver::key("p", c) == KeyDeriver::key("p", d));
    std::cout << "[OK] KeyDeriver determinism\n";
}

void smokeTestKeySensitivity() {
    assert(KeyDeriver::key("p", {{"a", 1}}) != KeyDeriver::key("p", {{"a", 2}}));
    assert(KeyDeriver::key("p", {{"a", 1}}) != KeyDeriver::key("q", {{"a", 1}}));
    assert(KeyDeriver::key("p", {{"a", 1}}) != KeyDeriver::key("p", {{"b", 1}}));
    assert(KeyDeriver::key("p", {{"a", 1}}) != KeyDeriver::key("p", {{"a", "1"}}));
    assert(KeyDeriver::key("p", {}) == KeyDeriver::key("p", {}));
    std::cout << "[OK] KeyDeriver sensitivity\n";
}

void smokeTestToKeyValue() {
    assert(toKeyValue(7) == nlohmann::json(7));
    assert(toKeyValue(std::string("x")) == nlohmann::json("x"));
    assert(toKeyValue(std::vector<int>{1, 2}) == nlohmann::json::array({1, 2}));
    assert(toKeyValue(Room{"den"}) == nlohmann::json("Room(den)"));
    std::cout << "[OK] toKeyValue coercion\n";
}

void smokeTestSanitize() {
    assert(KeyDeriver::sanitize("a/b\\c_d") == "a_b_c_d");
    assert(KeyDeriver::sanitize("plain") == "plain");
    std::cout << "[OK] KeyDeriver sanitize\n";
}

void smokeTestEntryJson() {
    CacheEntry entry;
    entry.value = {{"text", "Привет"}, {"n", 3}};
    entry.createdAt = ExpirationPolicy::fromUnixSeconds(1000.5);
    entry.expiresAt = ExpirationPolicy::fromUnixSeconds(2000.25);
    entry.cacheKey = "p_0123456789abcdef";
    entry.metadata = {{"params", {{"a", 1}}}, {"value", "ignored"}};

    nlohmann::json j = entry.toJson();
    assert(j["value"] == entry.value);
    assert(j["expires_at"].get<double>() == 2000.25);
    assert(j["created_at"].get<double>() == 1000.5);
    assert(j["cache_key"] == "p_0123456789abcdef");
    assert(j["params"]["a"] == 1);

    CacheEntry restored = CacheEntry::fromJson(j);
    assert(restored.value == entry.value);
    assert(restored.cacheKey == entry.cacheKey);
    assert(restored.metadata.contains("params"));
    assert(!restored.metadata.contains("value"));
    assert(!restored.isExpired(ExpirationPolicy::fromUnixSeconds(2000.25)));
    assert(restored.isExpired(ExpirationPolicy::fromUnixSeconds(2000.5)));

    // Без expires_at запись считается истёкшей
    CacheEntry legacy = CacheEntry::fromJson({{"value", 1}});
    assert(legacy.isExpired(ExpirationPolicy::now()));

    bool threw = false;
    try {
        CacheEntry::fromJson(nlohmann::json::array());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] CacheEntry JSON format\n";
}

void smokeTestExpiryRange() {
    const Timestamp now = ExpirationPolicy::now();

    // TTL за пределами диапазона часов не переполняется
    Timestamp forever = ExpirationPolicy::expiresAfter(now, std::chrono::hours(24 * 365 * 300));
    assert(forever == Timestamp::max());
    assert(!ExpirationPolicy::isExpired(forever, now));
    Timestamp week = ExpirationPolicy::expiresAfter(now, std::chrono::hours(24 * 7));
    assert(week == now + std::chrono::hours(24 * 7));
    assert(ExpirationPolicy::expiresAfter(now, std::chrono::milliseconds(0)) == now);

    // Бессрочная запись переживает сериализацию
    assert(ExpirationPolicy::isRepresentable(ExpirationPolicy::toUnixSeconds(Timestamp::max())));
    assert(ExpirationPolicy::fromUnixSeconds(ExpirationPolicy::toUnixSeconds(Timestamp::max())) == Timestamp::max());
    assert(ExpirationPolicy::fromUnixSeconds(1e300) == Timestamp::max());
    assert(ExpirationPolicy::fromUnixSeconds(-1e300) == Timestamp::min());
    assert(!ExpirationPolicy::isRepresentable(1e300));
    assert(!ExpirationPolicy::isRepresentable(std::numeric_limits<double>::infinity()));
    assert(!ExpirationPolicy::isRepresentable(std::numeric_limits<double>::quiet_NaN()));

    for (double bad : {1e300, -1e300}) {
        bool threw = false;
        try {
            CacheEntry::fromJson({{"value", 1}, {"expires_at", bad}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    bool threw = false;
    try {
        CacheEntry::fromJson({{"value", 1}, {"expires_at", 1.0}, {"created_at", 1e300}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] Expiry stays within the clock range\n";
}

int main() {
    smokeTestKeyFormat();
    smokeTestKeyDeterminism();
    smokeTestKeySensitivity();
    smokeTestToKeyValue();
    smokeTestSanitize();
    smokeTestEntryJson();
    smokeTestExpiryRange();
    std::cout << "All KeyDeriver tests passed!\n";
    return 0;
}
