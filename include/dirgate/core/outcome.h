// DIRGATE - Validation Outcome
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#ifndef DIRGATE_CORE_OUTCOME_H
#define DIRGATE_CORE_OUTCOME_H

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace dirgate {

/**
 * Result of checking untrusted input: either the validated value or a
 * reason that is safe to show to the caller.
 *
 * Rejecting bad input is an expected outcome, so guards return this
 * instead of throwing.
 */
template<typename T>
class ValidationOutcome {
public:
    static ValidationOutcome Valid(T value) {
        ValidationOutcome outcome;
        outcome.value_.emplace(std::move(value));
        return outcome;
    }

    static ValidationOutcome Invalid(std::string reason) {
        ValidationOutcome outcome;
        outcome.reason_ = std::move(reason);
        return outcome;
    }

    bool IsValid() const { return value_.has_value(); }
    explicit operator bool() const { return IsValid(); }

    /// @throws std::logic_error when called on an invalid outcome
    const T& Value() const {
        if (!value_) {
            throw std::logic_error("ValidationOutcome::Value on invalid outcome: " + reason_);
        }
        return *value_;
    }

    T&& TakeValue() {
        if (!value_) {
            throw std::logic_error("ValidationOutcome::TakeValue on invalid outcome: " + reason_);
        }
        return std::move(*value_);
    }

    /// Empty for valid outcomes
    const std::string& Reason() const { return reason_; }

private:
    ValidationOutcome() = default;

    std::optional<T> value_;
    std::string reason_;
};

} // namespace dirgate

#endif // DIRGATE_CORE_OUTCOME_H
