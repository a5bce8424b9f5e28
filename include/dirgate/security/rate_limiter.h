// DIRGATE - Sliding Window Rate Limiter
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#ifndef DIRGATE_SECURITY_RATE_LIMITER_H
#define DIRGATE_SECURITY_RATE_LIMITER_H

#include "dirgate/core/types.h"
#include "dirgate/util/time.h"

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace dirgate {
namespace security {

/**
 * Per-(caller, operation) sliding window limiter.
 *
 * Each key owns its own lock, so callers only contend with themselves.
 * The key map is guarded by a reader/writer lock that is held exclusively
 * only when a key is created or swept.
 *
 * Time comes from util::GetSystemTime() and follows mock time in tests.
 */
class RateLimiter {
public:
    struct Config {
        util::Seconds window{15 * 60};
        size_t maxRequests{100};
    };

    RateLimiter();
    explicit RateLimiter(const Config& config);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Admit and record a request if fewer than maxRequests remain in the
     * trailing window. Rejected requests are not recorded.
     */
    bool Permit(const std::string& callerId, OperationKind operation);

    /// Drop keys whose windows have emptied; returns the number removed
    size_t Sweep();

    size_t TrackedKeys() const;

    /// Timestamps currently held for a key (not pruned)
    size_t RecordedRequests(const std::string& callerId, OperationKind operation) const;

    const Config& GetConfig() const { return config_; }

private:
    using Key = std::pair<std::string, OperationKind>;

    struct Window {
        std::mutex mutex;
        std::deque<util::SystemTimePoint> timestamps;
        bool retired{false};   // Removed from the map by Sweep
    };

    std::shared_ptr<Window> FindOrCreate(const Key& key);
    static void Prune(Window& window, util::SystemTimePoint cutoff);

    Config config_;

    mutable std::shared_mutex mapMutex_;
    std::map<Key, std::shared_ptr<Window>> windows_;
};

} // namespace security
} // namespace dirgate

#endif // DIRGATE_SECURITY_RATE_LIMITER_H
