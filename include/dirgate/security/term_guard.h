// DIRGATE - Search Term Guard
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#ifndef DIRGATE_SECURITY_TERM_GUARD_H
#define DIRGATE_SECURITY_TERM_GUARD_H

#include "dirgate/core/outcome.h"

#include <cstddef>
#include <string>

namespace dirgate {
namespace security {

/// Default maximum search term length
constexpr size_t DEFAULT_MAX_TERM_LENGTH = 100;

/**
 * Validates free-text search terms. Accepted terms contain only letters,
 * digits, whitespace, '-', '_' and '.', and are returned HTML-encoded.
 */
class TermGuard {
public:
    struct Config {
        size_t maxLength{DEFAULT_MAX_TERM_LENGTH};
    };

    TermGuard();
    explicit TermGuard(const Config& config);

    ValidationOutcome<std::string> Validate(const std::string& term) const;

    /// Encode & < > " ' as HTML entities
    static std::string HtmlEncode(const std::string& text);

    size_t MaxLength() const { return config_.maxLength; }

private:
    static bool HasForbiddenSequence(const std::string& term);
    static bool IsAllowedCharacter(char c);

    Config config_;
};

} // namespace security
} // namespace dirgate

#endif // DIRGATE_SECURITY_TERM_GUARD_H
