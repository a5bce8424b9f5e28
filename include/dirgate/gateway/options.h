// DIRGATE - Gateway Options
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#ifndef DIRGATE_GATEWAY_OPTIONS_H
#define DIRGATE_GATEWAY_OPTIONS_H

#include "dirgate/search/tree_search.h"
#include "dirgate/security/path_guard.h"
#include "dirgate/security/rate_limiter.h"
#include "dirgate/security/term_guard.h"
#include "dirgate/security/upload_guard.h"
#include "dirgate/util/config.h"
#include "dirgate/util/time.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dirgate {
namespace gateway {

/**
 * Settings read once at startup. They do not change for the lifetime of
 * the process.
 */
struct GatewayOptions {
    std::string root{"."};
    uint64_t maxFileSize{security::DEFAULT_MAX_FILE_SIZE};
    size_t maxPathLength{security::DEFAULT_MAX_PATH_LENGTH};
    size_t maxTermLength{security::DEFAULT_MAX_TERM_LENGTH};
    std::vector<std::string> allowedExtensions;

    util::Seconds rateWindow{15 * 60};
    size_t rateMaxRequests{100};

    size_t searchMaxResults{search::DEFAULT_MAX_RESULTS};
    size_t searchMaxDepth{search::DEFAULT_MAX_DEPTH};
    util::Milliseconds searchTimeBudget{search::DEFAULT_TIME_BUDGET};

    /**
     * Read options from configuration. Absent keys keep their defaults.
     * @throws std::invalid_argument for malformed or out-of-range values
     */
    static GatewayOptions FromConfig(const util::ConfigManager& config);

    security::PathGuard::Config PathGuardConfig() const;
    security::UploadGuard::Config UploadGuardConfig() const;
    security::TermGuard::Config TermGuardConfig() const;
    security::RateLimiter::Config RateLimiterConfig() const;
};

} // namespace gateway
} // namespace dirgate

#endif // DIRGATE_GATEWAY_OPTIONS_H
