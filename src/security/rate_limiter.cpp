// DIRGATE - Sliding Window Rate Limiter Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/security/rate_limiter.h"

#include "dirgate/util/logging.h"

namespace dirgate {
namespace security {

RateLimiter::RateLimiter() : RateLimiter(Config{}) {}

RateLimiter::RateLimiter(const Config& config) : config_(config) {}

void RateLimiter::Prune(Window& window, util::SystemTimePoint cutoff) {
    while (!window.timestamps.empty() && window.timestamps.front() < cutoff) {
        window.timestamps.pop_front();
    }
}

std::shared_ptr<RateLimiter::Window> RateLimiter::FindOrCreate(const Key& key) {
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex_);
        auto it = windows_.find(key);
        if (it != windows_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    auto& slot = windows_[key];
    if (!slot) {
        slot = std::make_shared<Window>();
    }
    return slot;
}

bool RateLimiter::Permit(const std::string& callerId, OperationKind operation) {
    Key key(callerId, operation);

    while (true) {
        std::shared_ptr<Window> window = FindOrCreate(key);
        std::lock_guard<std::mutex> lock(window->mutex);

        // Lost a race with Sweep; the next lookup creates a fresh window
        if (window->retired) {
            continue;
        }

        util::SystemTimePoint now = util::GetSystemTime();
        Prune(*window, now - config_.window);

        if (window->timestamps.size() >= config_.maxRequests) {
            LOG_WARN(util::LogCategory::SECURITY) << "Rate limit exceeded for client " << callerId
                                            << ", operation " << OperationKindToString(operation);
            return false;
        }

        window->timestamps.push_back(now);
        return true;
    }
}

size_t RateLimiter::Sweep() {
    util::SystemTimePoint cutoff = util::GetSystemTime() - config_.window;
    size_t removed = 0;

    std::unique_lock<std::shared_mutex> mapLock(mapMutex_);
    for (auto it = windows_.begin(); it != windows_.end();) {
        // Keep the window alive until its lock is released
        std::shared_ptr<Window> window = it->second;
        std::lock_guard<std::mutex> lock(window->mutex);
        Prune(*window, cutoff);
        if (window->timestamps.empty()) {
            window->retired = true;
            it = windows_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG(util::LogCategory::SECURITY) << "Rate limiter swept " << removed << " idle keys, "
                                         << windows_.size() << " remain";
    }
    return removed;
}

size_t RateLimiter::TrackedKeys() const {
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    return windows_.size();
}

size_t RateLimiter::RecordedRequests(const std::string& callerId, OperationKind operation) const {
    std::shared_ptr<Window> window;
    {
        std::shared_lock<std::shared_mutex> lock(mapMutex_);
        auto it = windows_.find(Key(callerId, operation));
        if (it == windows_.end()) {
            return 0;
        }
        window = it->second;
    }
    std::lock_guard<std::mutex> lock(window->mutex);
    return window->timestamps.size();
}

} // namespace security
} // namespace dirgate
