#pragma once

#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace homebook {
namespace core {
namespace cache {

// Именованные параметры ключа; std::map даёт порядок по имени
using KeyParams = std::map<std::string, nlohmann::json>;

/**
 * @brief Привести значение параметра к JSON.
 * @details Типы без JSON-представления приводятся к строке через operator<<.
 * Два разных объекта с одинаковым строковым видом дают один ключ; для кэша
 * генераций это допустимо.
 */
template<typename T>
nlohmann::json toKeyValue(const T& value) {
    if constexpr (std::is_constructible_v<nlohmann::json, const T&>) {
        return nlohmann::json(value);
    } else {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
}

// KeyDeriver: детерминированный ключ "{prefix}_{digest}" из префикса и параметров
class KeyDeriver {
public:
    static constexpr size_t kDigestLength = 16; // Шестнадцатеричных символов SHA-256

    // Ключ не зависит от порядка добавления параметров
    static std::string key(const std::string& prefix, const KeyParams& params);

    // Каноническая форма: JSON-массив пар [имя, значение] по возрастанию имени
    static std::string canonicalForm(const KeyParams& params);

    // Ключ, пригодный для имени файла: '/' и '\' заменяются на '_'
    static std::string sanitize(const std::string& key);

private:
    static std::string sha256Hex(const std::string& data);
};

} // namespace cache
} // namespace core
} // namespace homebook
