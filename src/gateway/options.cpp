// DIRGATE - Gateway Options Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/gateway/options.h"

#include <stdexcept>

namespace dirgate {
namespace gateway {

namespace {

/// Unsigned value that must be well formed when present
uint64_t ReadUInt(const util::ConfigManager& config, const char* key,
                  uint64_t defaultValue, uint64_t minimum) {
    if (!config.HasKey(key)) {
        return defaultValue;
    }
    auto value = config.TryGetUInt(key);
    if (!value) {
        throw std::invalid_argument(std::string("Invalid value for -") + key + ": '" +
                                    config.GetString(key, "") + "'");
    }
    if (*value < minimum) {
        throw std::invalid_argument(std::string("Value for -") + key + " must be at least " +
                                    std::to_string(minimum));
    }
    return *value;
}

} // namespace

GatewayOptions GatewayOptions::FromConfig(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;

    GatewayOptions options;
    options.root = config.GetPath(keys::ROOT, options.root);
    if (options.root.empty()) {
        throw std::invalid_argument("Value for -root must not be empty");
    }

    options.maxFileSize = ReadUInt(config, keys::MAXFILESIZE, options.maxFileSize, 1);
    options.maxPathLength = ReadUInt(config, keys::MAXPATHLENGTH, options.maxPathLength, 1);
    options.maxTermLength = ReadUInt(config, keys::MAXTERMLENGTH, options.maxTermLength, 1);
    options.allowedExtensions = config.GetList(keys::ALLOWEDEXT);

    options.rateWindow = util::Minutes(
        ReadUInt(config, keys::RATEWINDOW,
                 std::chrono::duration_cast<util::Minutes>(options.rateWindow).count(), 1));
    options.rateMaxRequests = ReadUInt(config, keys::RATEMAX, options.rateMaxRequests, 1);

    options.searchMaxResults = ReadUInt(config, keys::SEARCHMAXRESULTS, options.searchMaxResults, 1);
    options.searchMaxDepth = ReadUInt(config, keys::SEARCHMAXDEPTH, options.searchMaxDepth, 0);
    options.searchTimeBudget = util::Seconds(
        ReadUInt(config, keys::SEARCHTIMEOUT,
                 std::chrono::duration_cast<util::Seconds>(options.searchTimeBudget).count(), 1));

    return options;
}

security::PathGuard::Config GatewayOptions::PathGuardConfig() const {
    security::PathGuard::Config config;
    config.root = root;
    config.maxPathLength = maxPathLength;
    return config;
}

security::UploadGuard::Config GatewayOptions::UploadGuardConfig() const {
    security::UploadGuard::Config config;
    config.maxFileSize = maxFileSize;
    config.allowedExtensions = allowedExtensions;
    return config;
}

security::TermGuard::Config GatewayOptions::TermGuardConfig() const {
    security::TermGuard::Config config;
    config.maxLength = maxTermLength;
    return config;
}

security::RateLimiter::Config GatewayOptions::RateLimiterConfig() const {
    security::RateLimiter::Config config;
    config.window = rateWindow;
    config.maxRequests = rateMaxRequests;
    return config;
}

} // namespace gateway
} // namespace dirgate
