#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <list>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/entry/CacheEntry.hpp"
#include "core/logging/Logging.hpp"

namespace homebook {
namespace core {
namespace cache {

// MemoryTier: потокобезопасный LRU-уровень с ограничением по количеству записей.
// Карта и список давности меняются только вместе под одним мьютексом.
// Вытеснение выполняется до вставки нового ключа, ёмкость не превышается даже временно.
// Callback вытеснения вызывается после освобождения мьютекса и может обращаться к уровню.
template<typename Key, typename Value>
class MemoryTier : public BaseCache<Key, Value> {
public:
    using KeyType = Key;
    using DataType = Value;
    using EvictionCallback = std::function<void(const Key&, const Value&)>;
    using Predicate = std::function<bool(const Key&, const Value&)>;
    using ValuePredicate = std::function<bool(const Value&)>;

    explicit MemoryTier(size_t capacity, const std::string& loggerName = "memorytier"); // Конструктор
    ~MemoryTier() override = default;

    std::optional<Value> get(const Key& key) override; // Получить (обновляет давность)
    bool put(const Key& key, const Value& value) override; // Сохранить (замена целиком)
    // Сохранить, если ключа нет или replaceExisting(текущее значение) == true
    bool putIf(const Key& key, const Value& value, const ValuePredicate& replaceExisting);
    bool remove(const Key& key) override; // Удалить
    size_t clear() override; // Очистить
    size_t size() const override; // Размер
    size_t capacity() const; // Ёмкость

    bool contains(const Key& key) const; // Без обновления давности
    std::vector<Key> keys() const; // От самого свежего к самому старому
    std::vector<Key> removeIf(const Predicate& predicate); // Удалить по условию
    bool removeIf(const Key& key, const ValuePredicate& predicate); // Удалить ключ, если условие верно
    void setEvictionCallback(EvictionCallback cb); // Callback вытеснения

private:
    using Evicted = std::optional<std::pair<Key, Value>>;

    // Вызываются под mutex_
    Evicted insertLocked(const Key& key, const Value& value);
    Evicted evictLRU();
    // Вызывается без блокировки
    void notifyEvicted(Evicted evicted, const EvictionCallback& callback);

    size_t capacity_;
    std::unordered_map<KeyType, std::pair<typename std::list<KeyType>::iterator, DataType>> cache_;
    std::list<KeyType> lruList_; // front: самый свежий, back: кандидат на вытеснение
    mutable std::mutex mutex_;
    EvictionCallback evictionCallback_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Уровень памяти для записей кэша генераций
using EntryMemoryTier = MemoryTier<std::string, CacheEntry>;

} // namespace cache
} // namespace core
} // namespace homebook

// Реализация шаблонного класса
namespace homebook {
namespace core {
namespace cache {

template<typename Key, typename Value>
MemoryTier<Key, Value>::MemoryTier(size_t capacity, const std::string& loggerName)
    : capacity_(capacity), logger_(logging::getLogger(loggerName)) {
    if (capacity == 0) {
        throw std::invalid_argument("MemoryTier capacity must be positive");
    }
    cache_.reserve(capacity);
}

template<typename Key, typename Value>
std::optional<Value> MemoryTier<Key, Value>::get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }

    // Обновляем LRU
    lruList_.splice(lruList_.begin(), lruList_, it->second.first);
    return it->second.second;
}

template<typename Key, typename Value>
bool MemoryTier<Key, Value>::put(const Key& key, const Value& value) {
    return putIf(key, value, [](const Value&) { return true; });
}

template<typename Key, typename Value>
bool MemoryTier<Key, Value>::putIf(const Key& key, const Value& value, const ValuePredicate& replaceExisting) {
    Evicted evicted;
    EvictionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_.find(key);
        if (it != cache_.end()) {
            if (!replaceExisting(it->second.second)) {
                return false;
            }
            it->second.second = value;
            lruList_.splice(lruList_.begin(), lruList_, it->second.first);
            return true;
        }

        evicted = insertLocked(key, value);
        callback = evictionCallback_;
    }
    notifyEvicted(std::move(evicted), callback);
    return true;
}

template<typename Key, typename Value>
typename MemoryTier<Key, Value>::Evicted MemoryTier<Key, Value>::insertLocked(const Key& key, const Value& value) {
    Evicted evicted;
    if (cache_.size() >= capacity_) {
        evicted = evictLRU();
    }

    lruList_.push_front(key);
    try {
        cache_.emplace(key, std::make_pair(lruList_.begin(), value));
    } catch (...) {
        lruList_.pop_front();
        throw;
    }
    return evicted;
}

template<typename Key, typename Value>
bool MemoryTier<Key, Value>::remove(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    lruList_.erase(it->second.first);
    cache_.erase(it);
    return true;
}

template<typename Key, typename Value>
size_t MemoryTier<Key, Value>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = cache_.size();
    cache_.clear();
    lruList_.clear();
    return removed;
}

template<typename Key, typename Value>
size_t MemoryTier<Key, Value>::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

template<typename Key, typename Value>
size_t MemoryTier<Key, Value>::capacity() const {
    return capacity_;
}

template<typename Key, typename Value>
bool MemoryTier<Key, Value>::contains(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.find(key) != cache_.end();
}

template<typename Key, typename Value>
std::vector<Key> MemoryTier<Key, Value>::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Key>(lruList_.begin(), lruList_.end());
}

template<typename Key, typename Value>
std::vector<Key> MemoryTier<Key, Value>::removeIf(const Predicate& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Key> removed;
    for (auto it = lruList_.begin(); it != lruList_.end();) {
        auto cacheIt = cache_.find(*it);
        if (cacheIt != cache_.end() && predicate(cacheIt->first, cacheIt->second.second)) {
            removed.push_back(*it);
            cache_.erase(cacheIt);
            it = lruList_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

template<typename Key, typename Value>
bool MemoryTier<Key, Value>::removeIf(const Key& key, const ValuePredicate& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end() || !predicate(it->second.second)) {
        return false;
    }
    lruList_.erase(it->second.first);
    cache_.erase(it);
    return true;
}

template<typename Key, typename Value>
void MemoryTier<Key, Value>::setEvictionCallback(EvictionCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    evictionCallback_ = std::move(cb);
}

template<typename Key, typename Value>
typename MemoryTier<Key, Value>::Evicted MemoryTier<Key, Value>::evictLRU() {
    if (lruList_.empty()) return std::nullopt;

    Evicted evicted;
    auto it = cache_.find(lruList_.back());
    if (it != cache_.end()) {
        logger_->debug("Evicted cache entry: {}", it->first);
        evicted.emplace(it->first, std::move(it->second.second));
        cache_.erase(it);
    }
    lruList_.pop_back();
    return evicted;
}

template<typename Key, typename Value>
void MemoryTier<Key, Value>::notifyEvicted(Evicted evicted, const EvictionCallback& callback) {
    if (evicted && callback) {
        callback(evicted->first, evicted->second);
    }
}

} // namespace cache
} // namespace core
} // namespace homebook
