#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "core/cache/tier/MemoryTier.hpp"

using homebook::core::cache::MemoryTier;
using homebook::core::cache::EntryMemoryTier;
using homebook::core::cache::CacheEntry;

void smokeTestMemoryTier() {
    MemoryTier<std::string, int> tier(4);
    tier.put("a", 1);
    tier.put("b", 2);
    assert(tier.size() == 2);
    auto v = tier.get("a");
    assert(v && *v == 1);
    assert(!tier.get("missing"));
    bool removed = tier.remove("a");
    assert(removed);
    assert(!tier.remove("a"));
    size_t cleared = tier.clear();
    assert(cleared == 1);
    assert(tier.size() == 0);
    std::cout << "[OK] MemoryTier smoke test\n";
}

void testLruOrder() {
    EntryMemoryTier tier(3);
    size_t evicted = 0;
    tier.setEvictionCallback([&evicted](const std::string&, const CacheEntry&) { ++evicted; });
    auto entry = [](int n) {
        CacheEntry e;
        e.value = n;
        return e;
    };
    tier.put("k1", entry(1));
    tier.put("k2", entry(2));
    tier.put("k3", entry(3));
    auto touched = tier.get("k1"); // k1 становится самым свежим
    assert(touched && touched->value == 1);
    tier.put("k4", entry(4)); // вытесняет k2

    assert(tier.size() == 3);
    assert(tier.contains("k1"));
    assert(!tier.contains("k2"));
    assert(tier.contains("k3"));
    assert(tier.contains("k4"));
    assert(evicted == 1);

    std::vector<std::string> expected{"k4", "k1", "k3"};
    assert(tier.keys() == expected);
    std::cout << "[OK] MemoryTier LRU order\n";
}

void testReplaceDoesNotEvict() {
    MemoryTier<std::string, int> tier(2);
    size_t evicted = 0;
    tier.setEvictionCallback([&evicted](const std::string&, const int&) { ++evicted; });
    tier.put("a", 1);
    tier.put("b", 2);
    tier.put("a", 10); // замена существующего ключа
    assert(evicted == 0);
    assert(tier.size() == 2);
    assert(*tier.get("a") == 10);

    tier.put("c", 3); // вытесняет b
    assert(evicted == 1);
    assert(!tier.contains("b"));
    std::cout << "[OK] MemoryTier replace without eviction\n";
}

void testRemoveIf() {
    MemoryTier<std::string, int> tier(10);
    tier.put("story_1", 1);
    tier.put("story_2", 2);
    tier.put("image_1", 3);
    auto removed = tier.removeIf([](const std::string& key, const int&) {
        return key.rfind("story_", 0) == 0;
    });
    assert(removed.size() == 2);
    assert(tier.size() == 1);
    assert(tier.contains("image_1"));
    std::cout << "[OK] MemoryTier removeIf\n";
}

void testConditionalPutAndRemove() {
    MemoryTier<std::string, int> tier(4);
    tier.put("a", 5);

    // Более старое значение не перетирает текущее
    bool replaced = tier.putIf("a", 3, [](const int& current) { return current < 3; });
    assert(!replaced);
    assert(*tier.get("a") == 5);
    replaced = tier.putIf("a", 7, [](const int& current) { return current < 7; });
    assert(replaced);
    assert(*tier.get("a") == 7);

    bool inserted = tier.putIf("b", 1, [](const int&) { return false; });
    assert(inserted);
    assert(tier.contains("b"));

    // Удаление только при совпадении условия
    bool removed = tier.removeIf("a", [](const int& current) { return current == 5; });
    assert(!removed);
    assert(tier.contains("a"));
    removed = tier.removeIf("a", [](const int& current) { return current == 7; });
    assert(removed);
    assert(!tier.contains("a"));
    assert(!tier.removeIf("missing", [](const int&) { return true; }));
    std::cout << "[OK] MemoryTier conditional put and remove\n";
}

void testEvictionCallbackReentry() {
    MemoryTier<std::string, int> tier(2);
    std::vector<std::string> seen;
    size_t sizeDuringCallback = 0;
    tier.setEvictionCallback([&](const std::string& key, const int&) {
        seen.push_back(key);
        sizeDuringCallback = tier.size();
        assert(!tier.contains(key));
    });
    tier.put("a", 1);
    tier.put("b", 2);
    tier.put("c", 3);
    assert(seen.size() == 1 && seen[0] == "a");
    assert(sizeDuringCallback == 2);
    std::cout << "[OK] MemoryTier eviction callback may use the tier\n";
}

void testInvalidCapacity() {
    bool threw = false;
    try {
        MemoryTier<std::string, int> tier(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] MemoryTier rejects zero capacity\n";
}

void stressTestMemoryTier() {
    MemoryTier<std::string, int> tier(128);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&tier, t]() {
            for (int i = 0; i < 5000; ++i) {
                std::string key = std::to_string((i * 7 + t) % 512);
                tier.put(key, i);
                tier.get(std::to_string(i % 512));
                if (i % 13 == 0) {
                    tier.remove(key);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    assert(tier.size() <= 128);
    assert(tier.keys().size() == tier.size());
    std::cout << "[OK] MemoryTier stress test\n";
}

int main() {
    smokeTestMemoryTier();
    testLruOrder();
    testReplaceDoesNotEvict();
    testRemoveIf();
    testConditionalPutAndRemove();
    testEvictionCallbackReentry();
    testInvalidCapacity();
    stressTestMemoryTier();
    std::cout << "All MemoryTier tests passed!\n";
    return 0;
}
