#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include "core/cache/tier/FileTier.hpp"

using namespace homebook::core::cache;
namespace fs = std::filesystem;

namespace {

fs::path freshDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("homebook_filetier_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    return dir;
}

CacheEntry makeEntry(const std::string& key, const nlohmann::json& value, std::chrono::milliseconds ttl) {
    CacheEntry entry;
    entry.value = value;
    entry.createdAt = ExpirationPolicy::now();
    entry.expiresAt = ExpirationPolicy::expiresAfter(entry.createdAt, ttl);
    entry.cacheKey = key;
    return entry;
}

void writeRaw(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace

void smokeTestFileTier() {
    fs::path dir = freshDir("smoke");
    FileTier tier(dir);
    assert(tier.available());
    assert(fs::is_directory(dir));

    nlohmann::json value = {{"title", "Дом у моря"}, {"rooms", {1, 2, 3}}, {"score", 4.5}};
    bool stored = tier.put("story_abc", makeEntry("story_abc", value, std::chrono::hours(1)));
    assert(stored);
    assert(fs::exists(dir / "story_abc.json"));

    auto entry = tier.get("story_abc");
    assert(entry && entry->value == value);
    assert(entry->cacheKey == "story_abc");
    assert(tier.size() == 1);

    // Формат на диске
    std::ifstream in(dir / "story_abc.json");
    nlohmann::json onDisk;
    in >> onDisk;
    assert(onDisk["value"] == value);
    assert(onDisk["expires_at"].is_number_float());
    assert(onDisk["cache_key"] == "story_abc");

    bool removed = tier.remove("story_abc");
    assert(removed);
    assert(!tier.get("story_abc"));
    assert(tier.size() == 0);

    fs::remove_all(dir);
    std::cout << "[OK] FileTier smoke test\n";
}

void testSanitizedPaths() {
    fs::path dir = freshDir("sanitize");
    FileTier tier(dir);
    bool stored = tier.put("a/b\\c", makeEntry("a/b\\c", 1, std::chrono::hours(1)));
    assert(stored);
    assert(tier.pathFor("a/b\\c") == dir / "a_b_c.json");
    assert(fs::exists(dir / "a_b_c.json"));
    auto entry = tier.get("a/b\\c");
    assert(entry && entry->value == 1);
    fs::remove_all(dir);
    std::cout << "[OK] FileTier sanitized paths\n";
}

void testSelfHealing() {
    fs::path dir = freshDir("corrupt");
    FileTier tier(dir);
    writeRaw(dir / "broken.json", "{not json");
    writeRaw(dir / "noval.json", "{\"expires_at\": 1.0}");

    assert(!tier.get("broken"));
    assert(!fs::exists(dir / "broken.json"));
    assert(!tier.get("noval"));
    assert(!fs::exists(dir / "noval.json"));
    fs::remove_all(dir);
    std::cout << "[OK] FileTier removes corrupt files\n";
}

void testExpiry() {
    fs::path dir = freshDir("expiry");
    FileTier tier(dir);
    tier.put("old", makeEntry("old", "stale", std::chrono::milliseconds(1)));
    tier.put("new", makeEntry("new", "fresh", std::chrono::hours(1)));
    writeRaw(dir / "garbage.json", "[]");

    auto later = ExpirationPolicy::now() + std::chrono::seconds(1);
    assert(!tier.get("old", later));
    assert(!fs::exists(dir / "old.json"));

    tier.put("old", makeEntry("old", "stale", std::chrono::milliseconds(1)));
    size_t swept = tier.sweepExpired(later);
    assert(swept == 2); // истёкший и повреждённый
    assert(tier.size() == 1);
    auto fresh = tier.get("new");
    assert(fresh && fresh->value == "fresh");
    fs::remove_all(dir);
    std::cout << "[OK] FileTier expiry and sweep\n";
}

void testPrefixOperations() {
    fs::path dir = freshDir("prefix");
    FileTier tier(dir);
    auto hour = std::chrono::hours(1);
    tier.put("story_1", makeEntry("story_1", 1, hour));
    tier.put("story_2", makeEntry("story_2", 2, hour));
    tier.put("storyboard_1", makeEntry("storyboard_1", 3, hour));
    tier.put("image_1", makeEntry("image_1", 4, hour));
    // Временные файлы других процессов не считаются записями
    writeRaw(dir / ".story_3.json.tmp-1-0", "{}");

    assert(tier.listByPrefix("story").size() == 2);
    size_t removed = tier.removeByPrefix("story");
    assert(removed == 2);
    assert(tier.get("storyboard_1"));
    assert(tier.size() == 2);

    size_t cleared = tier.clear();
    assert(cleared == 2);
    assert(tier.size() == 0);
    fs::remove_all(dir);
    std::cout << "[OK] FileTier prefix operations\n";
}

void testPrefixMatchesStoredKey() {
    fs::path dir = freshDir("prefixkey");
    FileTier tier(dir);
    auto hour = std::chrono::hours(1);
    // Оба ключа ложатся в файлы "a_b_*.json"
    tier.put("a/b_1", makeEntry("a/b_1", 1, hour));
    tier.put("a_b_2", makeEntry("a_b_2", 2, hour));

    auto keys = tier.listByPrefix("a/b");
    assert(keys.size() == 1 && keys[0] == "a/b_1");
    size_t removed = tier.removeByPrefix("a/b");
    assert(removed == 1);
    assert(!fs::exists(dir / "a_b_1.json"));
    assert(fs::exists(dir / "a_b_2.json"));
    auto kept = tier.get("a_b_2");
    assert(kept && kept->value == 2);

    assert(tier.removeByPrefix("a_b") == 1);
    assert(tier.size() == 0);
    fs::remove_all(dir);
    std::cout << "[OK] FileTier prefix matches stored cache key\n";
}

void testStaleTempFiles() {
    fs::path dir = freshDir("tempfiles");
    FileTier tier(dir);
    tier.put("live", makeEntry("live", 1, std::chrono::hours(1)));
    fs::path stale = dir / ".story_1.json.tmp-42-0";
    fs::path fresh = dir / ".story_2.json.tmp-42-1";
    writeRaw(stale, "{\"value\":");
    writeRaw(fresh, "{\"value\":");
    fs::last_write_time(stale, fs::file_time_type::clock::now() - std::chrono::hours(1));

    // Временные файлы не входят в счётчик удалённых записей
    size_t swept = tier.sweepExpired(ExpirationPolicy::now());
    assert(swept == 0);
    assert(!fs::exists(stale));
    assert(fs::exists(fresh));
    assert(tier.size() == 1);

    fs::last_write_time(fresh, fs::file_time_type::clock::now() - std::chrono::hours(1));
    size_t cleared = tier.clear();
    assert(cleared == 1);
    assert(!fs::exists(fresh));
    fs::remove_all(dir);
    std::cout << "[OK] FileTier removes abandoned temporary files\n";
}

void testUnrepresentableExpiry() {
    fs::path dir = freshDir("hugeexpiry");
    FileTier tier(dir);
    writeRaw(dir / "huge.json", "{\"value\": 1, \"expires_at\": 1e300}");
    writeRaw(dir / "negative.json", "{\"value\": 1, \"expires_at\": -1e300}");

    assert(!tier.get("huge"));
    assert(!fs::exists(dir / "huge.json"));
    size_t swept = tier.sweepExpired(ExpirationPolicy::now());
    assert(swept == 1);
    assert(!fs::exists(dir / "negative.json"));

    // Очень большой TTL хранится как "бессрочно" и читается обратно
    bool stored = tier.put("forever", makeEntry("forever", "v", std::chrono::hours(24 * 365 * 300)));
    assert(stored);
    auto forever = tier.get("forever");
    assert(forever && forever->value == "v");
    assert(forever->expiresAt == Timestamp::max());
    fs::remove_all(dir);
    std::cout << "[OK] FileTier treats out-of-range expiry as corrupt\n";
}

void testUnavailableDirectory() {
    fs::path blocker = freshDir("blocker");
    writeRaw(blocker, "regular file");
    FileTier tier(blocker / "cache");
    assert(!tier.available());

    bool stored = tier.put("k", makeEntry("k", 1, std::chrono::hours(1)));
    assert(!stored);
    assert(!tier.get("k"));
    assert(tier.size() == 0);
    assert(tier.clear() == 0);
    fs::remove(blocker);
    std::cout << "[OK] FileTier unavailable directory\n";
}

int main() {
    smokeTestFileTier();
    testSanitizedPaths();
    testSelfHealing();
    testExpiry();
    testPrefixOperations();
    testPrefixMatchesStoredKey();
    testStaleTempFiles();
    testUnrepresentableExpiry();
    testUnavailableDirectory();
    std::cout << "All FileTier tests passed!\n";
    return 0;
}
