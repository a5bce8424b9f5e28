// DIRGATE - Search Term Guard Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/security/term_guard.h"

#include <algorithm>
#include <cctype>

namespace dirgate {
namespace security {

namespace {
    constexpr const char* FORBIDDEN_CHARS = "~$%&*|<>?:\"\\/";
}

TermGuard::TermGuard() : TermGuard(Config{}) {}

TermGuard::TermGuard(const Config& config) : config_(config) {}

bool TermGuard::HasForbiddenSequence(const std::string& term) {
    return term.find("..") != std::string::npos ||
           term.find_first_of(FORBIDDEN_CHARS) != std::string::npos;
}

bool TermGuard::IsAllowedCharacter(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    // ASCII only: the C locale classifies bytes >= 0x80 as neither
    return std::isalnum(uc) || std::isspace(uc) || c == '-' || c == '_' || c == '.';
}

std::string TermGuard::HtmlEncode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

ValidationOutcome<std::string> TermGuard::Validate(const std::string& term) const {
    using Outcome = ValidationOutcome<std::string>;

    const char* whitespace = " \t\r\n\v\f";
    size_t start = term.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return Outcome::Invalid("Search term cannot be empty");
    }
    size_t end = term.find_last_not_of(whitespace);
    std::string trimmed = term.substr(start, end - start + 1);

    if (trimmed.size() > config_.maxLength) {
        return Outcome::Invalid("Search term too long (max " +
                                std::to_string(config_.maxLength) + " characters)");
    }

    if (HasForbiddenSequence(trimmed) ||
        !std::all_of(trimmed.begin(), trimmed.end(), IsAllowedCharacter)) {
        return Outcome::Invalid("Search term contains invalid characters");
    }

    return Outcome::Valid(HtmlEncode(trimmed));
}

} // namespace security
} // namespace dirgate
