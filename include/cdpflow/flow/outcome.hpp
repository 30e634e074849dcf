#pragma once

#include <optional>
#include <string_view>

#include "cdpflow/core/error.hpp"

namespace cdpflow::flow {

/// Closed set of results a polling predicate or event predicate can give.
enum class OutcomeKind {
    Success,     // done / matched
    Continue,    // not done yet, poll again (owned by wait_until)
    NotMatched,  // event is irrelevant, keep listening (owned by wait_nav_event)
    Failure,     // carries an Error
};

class Outcome {
public:
    static auto success() -> Outcome { return Outcome(OutcomeKind::Success); }
    static auto continue_waiting() -> Outcome { return Outcome(OutcomeKind::Continue); }
    static auto not_matched() -> Outcome { return Outcome(OutcomeKind::NotMatched); }
    static auto failure(Error error) -> Outcome {
        return Outcome(OutcomeKind::Failure, std::move(error));
    }

    /// Success for a value, Failure carrying the error otherwise.
    static auto from_result(const Result<void>& result) -> Outcome {
        if (result) return success();
        return failure(result.error());
    }

    [[nodiscard]] auto kind() const noexcept -> OutcomeKind { return kind_; }
    [[nodiscard]] auto is_success() const noexcept -> bool { return kind_ == OutcomeKind::Success; }
    [[nodiscard]] auto is_failure() const noexcept -> bool { return kind_ == OutcomeKind::Failure; }

    /// The carried error. Only meaningful when is_failure().
    [[nodiscard]] auto error() const -> const Error& { return *error_; }

private:
    explicit Outcome(OutcomeKind kind, std::optional<Error> error = std::nullopt)
        : kind_(kind), error_(std::move(error)) {}

    OutcomeKind kind_;
    std::optional<Error> error_;
};

inline auto outcome_kind_to_string(OutcomeKind kind) -> std::string_view {
    switch (kind) {
        case OutcomeKind::Success: return "success";
        case OutcomeKind::Continue: return "continue";
        case OutcomeKind::NotMatched: return "not_matched";
        case OutcomeKind::Failure: return "failure";
    }
    return "unknown";
}

} // namespace cdpflow::flow
