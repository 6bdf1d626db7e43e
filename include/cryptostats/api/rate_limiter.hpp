#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "cryptostats/util/i_clock.hpp"

namespace cryptostats::api {

using cryptostats::util::IClock;
using cryptostats::util::Timestamp;

// Token bucket per client address. A bucket starts full with `capacity`
// tokens and refills greedily at capacity/window, never above capacity.
// Buckets idle for a whole window are back at capacity and get dropped by
// a sweep that runs at most once per window.
class RateLimiter {
public:
    RateLimiter(const IClock& clock, std::uint32_t capacity, std::chrono::milliseconds window);

    bool try_consume(const std::string& clientAddress);

    // whole tokens left for the address; full capacity for unseen addresses
    std::uint32_t available(const std::string& clientAddress);

    std::size_t tracked_clients() const;

    // drops buckets untouched for at least one window; returns how many
    std::size_t evict_idle();

    std::uint32_t capacity() const noexcept { return capacity_; }

private:
    struct Bucket {
        double    tokens = 0.0;
        Timestamp lastRefill{};
    };

    Bucket& bucket_for(const std::string& clientAddress, const Timestamp& now);
    void refill(Bucket& bucket, const Timestamp& now) const;
    std::size_t sweep(const Timestamp& now);

    const IClock&             clock_;
    std::uint32_t             capacity_;
    std::chrono::milliseconds window_;

    std::unordered_map<std::string, Bucket> buckets_;
    Timestamp lastSweep_;
    mutable std::mutex mutex_;
};

}

#endif
