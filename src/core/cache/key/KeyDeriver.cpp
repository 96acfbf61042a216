#include "core/cache/key/KeyDeriver.hpp"
#include <algorithm>
#include <iomanip>
#include <openssl/sha.h>

namespace homebook {
namespace core {
namespace cache {

std::string KeyDeriver::key(const std::string& prefix, const KeyParams& params) {
    return prefix + "_" + sha256Hex(canonicalForm(params)).substr(0, kDigestLength);
}

std::string KeyDeriver::canonicalForm(const KeyParams& params) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [name, value] : params) {
        items.push_back(nlohmann::json::array({name, value}));
    }
    // Объекты внутри значений nlohmann::json сериализует с отсортированными ключами
    return items.dump();
}

std::string KeyDeriver::sanitize(const std::string& key) {
    std::string safe = key;
    std::replace(safe.begin(), safe.end(), '/', '_');
    std::replace(safe.begin(), safe.end(), '\\', '_');
    return safe;
}

std::string KeyDeriver::sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace cache
} // namespace core
} // namespace homebook
