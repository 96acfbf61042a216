#include "core/cache/tier/FileTier.hpp"
#include "core/cache/key/KeyDeriver.hpp"
#include "core/logging/Logging.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace homebook {
namespace core {
namespace cache {

namespace fs = std::filesystem;

namespace {
constexpr const char* kEntryExtension = ".json";
constexpr const char* kTempMarker = ".json.tmp-";
// Временный файл старше этого считается брошенным упавшим писателем
constexpr std::chrono::minutes kStaleTempAge{10};

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}
} // namespace

FileTier::FileTier(fs::path root, const std::string& loggerName)
    : root_(std::move(root)), logger_(logging::getLogger(loggerName)) {
    ensureDirectory();
}

bool FileTier::ensureDirectory() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec || !fs::is_directory(root_, ec)) {
        available_ = false;
        logger_->warn("Failed to create cache directory {}: {}", root_.string(),
                      ec ? ec.message() : "not a directory");
        return false;
    }
    available_ = true;
    return true;
}

bool FileTier::available() const {
    return available_.load();
}

const fs::path& FileTier::root() const {
    return root_;
}

fs::path FileTier::pathFor(const std::string& key) const {
    return root_ / (KeyDeriver::sanitize(key) + kEntryExtension);
}

std::optional<CacheEntry> FileTier::get(const std::string& key) {
    return get(key, ExpirationPolicy::now());
}

std::optional<CacheEntry> FileTier::get(const std::string& key, Timestamp now) {
    if (!available()) return std::nullopt;

    auto path = pathFor(key);
    std::optional<CacheEntry> entry;
    try {
        entry = readEntry(path);
    } catch (const std::exception& e) {
        logger_->warn("Cache read error for {}: {}", key, e.what());
        removeFile(path);
        return std::nullopt;
    }
    if (!entry) {
        return std::nullopt;
    }
    if (entry->isExpired(now)) {
        logger_->debug("Expired cache file removed: {}", key);
        removeFile(path);
        return std::nullopt;
    }
    return entry;
}

bool FileTier::put(const std::string& key, const CacheEntry& entry) {
    if (!available() && !ensureDirectory()) {
        return false;
    }

    auto target = pathFor(key);
    auto temp = tempPathFor(target);
    try {
        std::string payload = entry.toJson().dump(2);
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw std::runtime_error("cannot open " + temp.string());
            }
            file << payload;
            file.flush();
            if (!file) {
                throw std::runtime_error("write failed for " + temp.string());
            }
        }
        std::error_code ec;
        fs::rename(temp, target, ec);
        if (ec) {
            throw std::runtime_error("rename failed: " + ec.message());
        }
        return true;
    } catch (const std::exception& e) {
        logger_->warn("Failed to write cache file for {}: {}", key, e.what());
        removeFile(temp);
        return false;
    }
}

bool FileTier::remove(const std::string& key) {
    if (!available()) return false;
    return removeFile(pathFor(key));
}

size_t FileTier::clear() {
    removeStaleTempFiles();
    size_t count = 0;
    for (const auto& path : listEntryFiles()) {
        if (removeFile(path)) {
            ++count;
        }
    }
    return count;
}

size_t FileTier::size() const {
    return listEntryFiles().size();
}

size_t FileTier::removeByPrefix(const std::string& prefix) {
    size_t count = 0;
    for (const auto& match : matchPrefix(prefix)) {
        if (removeFile(match.first)) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> FileTier::listByPrefix(const std::string& prefix) const {
    std::vector<std::string> keys;
    for (auto& match : matchPrefix(prefix)) {
        keys.push_back(std::move(match.second));
    }
    return keys;
}

// Имя файла сужает выбор, решает сохранённый cache_key: "a/b_1" и "a_b_1" дают одно имя
std::vector<std::pair<fs::path, std::string>> FileTier::matchPrefix(const std::string& prefix) const {
    const std::string keyPrefix = prefix + "_";
    const std::string filePrefix = KeyDeriver::sanitize(prefix) + "_";
    std::vector<std::pair<fs::path, std::string>> matches;
    for (const auto& path : listEntryFiles()) {
        std::string stem = path.stem().string();
        if (!startsWith(stem, filePrefix)) {
            continue;
        }
        std::optional<CacheEntry> entry;
        try {
            entry = readEntry(path);
        } catch (const std::exception& e) {
            logger_->warn("Skipping unreadable cache file {}: {}", path.filename().string(), e.what());
            continue;
        }
        if (!entry) {
            continue;
        }
        if (entry->cacheKey.empty()) {
            // Файл без cache_key: остаётся только имя
            matches.emplace_back(path, std::move(stem));
        } else if (startsWith(entry->cacheKey, keyPrefix)) {
            matches.emplace_back(path, entry->cacheKey);
        }
    }
    return matches;
}

size_t FileTier::sweepExpired(Timestamp now) {
    removeStaleTempFiles();
    size_t count = 0;
    for (const auto& path : listEntryFiles()) {
        try {
            auto entry = readEntry(path);
            if (entry && entry->isExpired(now) && removeFile(path)) {
                ++count;
            }
        } catch (const std::exception& e) {
            // Повреждённые файлы удаляются и учитываются
            logger_->warn("Removing corrupt cache file {}: {}", path.filename().string(), e.what());
            if (removeFile(path)) {
                ++count;
            }
        }
    }
    return count;
}

std::vector<fs::path> FileTier::listEntryFiles() const {
    std::vector<fs::path> files;
    if (!available()) return files;

    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        logger_->warn("Cannot list cache directory {}: {}", root_.string(), ec.message());
        return files;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            logger_->warn("Error while listing {}: {}", root_.string(), ec.message());
            break;
        }
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && it->path().extension() == kEntryExtension) {
            files.push_back(it->path());
        }
    }
    return files;
}

size_t FileTier::removeStaleTempFiles() const {
    size_t count = 0;
    if (!available()) return count;

    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        logger_->warn("Cannot list cache directory {}: {}", root_.string(), ec.message());
        return count;
    }
    const auto now = fs::file_time_type::clock::now();
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            logger_->warn("Error while listing {}: {}", root_.string(), ec.message());
            break;
        }
        const std::string name = it->path().filename().string();
        if (name.empty() || name[0] != '.' || name.find(kTempMarker) == std::string::npos) {
            continue;
        }
        std::error_code timeEc;
        auto modified = fs::last_write_time(it->path(), timeEc);
        if (timeEc || now - modified < kStaleTempAge) {
            continue;
        }
        if (removeFile(it->path())) {
            ++count;
        }
    }
    if (count > 0) {
        logger_->info("Removed {} stale temporary cache files", count);
    }
    return count;
}

std::optional<CacheEntry> FileTier::readEntry(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    nlohmann::json j;
    file >> j;
    return CacheEntry::fromJson(j);
}

bool FileTier::removeFile(const fs::path& path) const {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        logger_->warn("Failed to delete cache file {}: {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

fs::path FileTier::tempPathFor(const fs::path& target) {
    // Не оканчивается на .json, поэтому не попадает в листинг
    return target.parent_path() /
           ("." + target.filename().string() + ".tmp-" + std::to_string(::getpid()) + "-" +
            std::to_string(tempCounter_.fetch_add(1)));
}

} // namespace cache
} // namespace core
} // namespace homebook
