#include "cryptostats/api/rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace cryptostats::api {

RateLimiter::RateLimiter(const IClock& clock, std::uint32_t capacity, std::chrono::milliseconds window)
    : clock_(clock)
    , capacity_(capacity)
    , window_(window)
    , lastSweep_(clock.now())
{
    if (capacity_ == 0 || window_.count() <= 0) {
        throw std::invalid_argument("rate limiter needs a positive capacity and window");
    }
}

bool RateLimiter::try_consume(const std::string& clientAddress)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const Timestamp now = clock_.now();
    if (now - lastSweep_ >= window_) sweep(now);

    Bucket& bucket = bucket_for(clientAddress, now);
    if (bucket.tokens < 1.0) {
        spdlog::warn("request from {} denied, rate limit exceeded", clientAddress);
        return false;
    }

    bucket.tokens -= 1.0;
    spdlog::debug("request from {} allowed, {} tokens left", clientAddress, static_cast<int>(bucket.tokens));
    return true;
}

std::uint32_t RateLimiter::available(const std::string& clientAddress)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(clientAddress);
    if (it == buckets_.end()) return capacity_;

    refill(it->second, clock_.now());
    return static_cast<std::uint32_t>(std::floor(it->second.tokens));
}

std::size_t RateLimiter::tracked_clients() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

std::size_t RateLimiter::evict_idle()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep(clock_.now());
}

std::size_t RateLimiter::sweep(const Timestamp& now)
{
    std::size_t evicted = 0;
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (now - it->second.lastRefill >= window_) {
            it = buckets_.erase(it);
            ++evicted;
        }
        else {
            ++it;
        }
    }
    lastSweep_ = now;

    if (evicted > 0) {
        spdlog::debug("evicted {} idle rate limit buckets, {} remain", evicted, buckets_.size());
    }
    return evicted;
}

RateLimiter::Bucket& RateLimiter::bucket_for(const std::string& clientAddress, const Timestamp& now)
{
    auto [it, inserted] = buckets_.try_emplace(clientAddress);
    if (inserted) {
        spdlog::info("new rate limit bucket for {}", clientAddress);
        it->second.tokens     = static_cast<double>(capacity_);
        it->second.lastRefill = now;
    }
    else {
        refill(it->second, now);
    }
    return it->second;
}

void RateLimiter::refill(Bucket& bucket, const Timestamp& now) const
{
    if (now <= bucket.lastRefill) return;

    const auto elapsed = now - bucket.lastRefill;
    const double added = static_cast<double>(capacity_) * static_cast<double>(elapsed.count())
                       / static_cast<double>(window_.count());

    bucket.tokens     = std::min(static_cast<double>(capacity_), bucket.tokens + added);
    bucket.lastRefill = now;
}

}
