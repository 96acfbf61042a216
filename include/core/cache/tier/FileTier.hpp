#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/entry/CacheEntry.hpp"

namespace homebook {
namespace core {
namespace cache {

/**
 * @brief Долговременный уровень: один JSON-файл на ключ в корневом каталоге.
 * @details Каталог создаётся лениво и идемпотентно. Если создать его не удалось,
 * уровень недоступен и все операции возвращают промах/0, без исключений.
 * Повреждённые файлы при чтении удаляются (самовосстановление).
 * Запись идёт во временный файл с последующим rename, поэтому читатели
 * из других процессов не видят частично записанных файлов.
 */
class FileTier : public BaseCache<std::string, CacheEntry> {
public:
    explicit FileTier(std::filesystem::path root, const std::string& loggerName = "filetier");
    ~FileTier() override = default;

    FileTier(const FileTier&) = delete;
    FileTier& operator=(const FileTier&) = delete;

    // clear() также удаляет брошенные временные файлы, в счётчик они не входят
    // Промах: нет файла, файл повреждён (удаляется) или истёк (удаляется)
    std::optional<CacheEntry> get(const std::string& key) override;
    std::optional<CacheEntry> get(const std::string& key, Timestamp now);
    bool put(const std::string& key, const CacheEntry& entry) override;
    bool remove(const std::string& key) override;
    size_t clear() override;
    size_t size() const override;

    // Удалить записи, чей cache_key начинается с "{prefix}_"
    size_t removeByPrefix(const std::string& prefix);
    // Ключи записей, начинающихся с "{prefix}_"
    std::vector<std::string> listByPrefix(const std::string& prefix) const;
    // Удалить истёкшие и повреждённые файлы (и брошенные временные, они не считаются)
    size_t sweepExpired(Timestamp now);
    // Удалить временные файлы старше 10 минут
    size_t removeStaleTempFiles() const;

    bool ensureDirectory();
    bool available() const;
    const std::filesystem::path& root() const;
    std::filesystem::path pathFor(const std::string& key) const;

private:
    std::vector<std::filesystem::path> listEntryFiles() const;
    std::vector<std::pair<std::filesystem::path, std::string>> matchPrefix(const std::string& prefix) const;
    std::optional<CacheEntry> readEntry(const std::filesystem::path& path) const;
    bool removeFile(const std::filesystem::path& path) const;
    std::filesystem::path tempPathFor(const std::filesystem::path& target);

    std::filesystem::path root_;
    std::atomic<bool> available_{false};
    std::atomic<uint64_t> tempCounter_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace core
} // namespace homebook
