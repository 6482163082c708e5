//! # Run Deadline
//!
//! An optional wall-clock limit for an analysis run. Stages call `check()`
//! at their boundaries; an expired deadline raises `DeadlineExceeded`, which
//! the analyzer maps to the `timeout` run status.
//!
//! ```cpp
//! auto deadline = Deadline::after(std::chrono::milliseconds(5000));
//! deadline.check("graph");   // throws DeadlineExceeded once expired
//! ```

#ifndef STRATA_DEADLINE_HPP
#define STRATA_DEADLINE_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace strata {

/// Raised when the run deadline passes. Carries the stage that noticed it.
class DeadlineExceeded : public std::runtime_error {
public:
    explicit DeadlineExceeded(const std::string& stage)
        : std::runtime_error("deadline exceeded during " + stage), stage_(stage) {}

    [[nodiscard]] auto stage() const -> const std::string& {
        return stage_;
    }

private:
    std::string stage_;
};

class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    /// No limit.
    Deadline() = default;

    [[nodiscard]] static auto none() -> Deadline {
        return Deadline();
    }

    [[nodiscard]] static auto after(std::chrono::milliseconds budget) -> Deadline {
        Deadline d;
        d.at_ = Clock::now() + budget;
        return d;
    }

    [[nodiscard]] static auto at(Clock::time_point when) -> Deadline {
        Deadline d;
        d.at_ = when;
        return d;
    }

    [[nodiscard]] auto is_set() const -> bool {
        return at_.has_value();
    }

    [[nodiscard]] auto expired() const -> bool {
        return at_ && Clock::now() >= *at_;
    }

    /// Throws `DeadlineExceeded` naming `stage` when expired.
    void check(std::string_view stage) const {
        if (expired()) {
            throw DeadlineExceeded(std::string(stage));
        }
    }

private:
    std::optional<Clock::time_point> at_;
};

} // namespace strata

#endif // STRATA_DEADLINE_HPP
