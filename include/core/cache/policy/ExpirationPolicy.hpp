#pragma once

#include <chrono>
#include <cmath>

namespace homebook {
namespace core {
namespace cache {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// ExpirationPolicy: единственное правило истечения для обоих уровней
struct ExpirationPolicy {
    // Верхняя граница TTL в конфигурации (100 лет)
    static constexpr std::chrono::hours kMaxTtl{24 * 365 * 100};

    static Timestamp now() { return Clock::now(); }

    // Запись истекла строго после expiresAt
    static bool isExpired(Timestamp expiresAt, Timestamp now) {
        return now > expiresAt;
    }

    static bool isExpired(Timestamp expiresAt) {
        return isExpired(expiresAt, now());
    }

    // Результат не выходит за Timestamp::max(): слишком большой TTL означает "бессрочно"
    static Timestamp expiresAfter(Timestamp from, std::chrono::milliseconds ttl) {
        if (ttl.count() <= 0) {
            return from;
        }
        const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::max() - from);
        if (ttl >= headroom) {
            return Timestamp::max();
        }
        return from + std::chrono::duration_cast<Clock::duration>(ttl);
    }

    // Формат на диске: дробные секунды unix
    static double toUnixSeconds(Timestamp ts) {
        return std::chrono::duration<double>(ts.time_since_epoch()).count();
    }

    // Наибольшее по модулю значение, которое fromUnixSeconds принимает без усечения
    static double maxUnixSeconds() {
        return std::chrono::duration<double>(Clock::duration::max()).count();
    }

    static bool isRepresentable(double seconds) {
        return std::isfinite(seconds) && std::fabs(seconds) <= maxUnixSeconds();
    }

    // Значения за пределами диапазона часов усекаются до min()/max()
    static Timestamp fromUnixSeconds(double seconds) {
        if (std::isnan(seconds)) {
            return Timestamp();
        }
        if (seconds >= maxUnixSeconds()) {
            return Timestamp::max();
        }
        if (seconds <= -maxUnixSeconds()) {
            return Timestamp::min();
        }
        return Timestamp(std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(seconds)));
    }
};

} // namespace cache
} // namespace core
} // namespace homebook
