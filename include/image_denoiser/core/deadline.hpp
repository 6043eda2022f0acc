#pragma once

#include "errors.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace image_denoiser::core {

// Processing budget of a single request. Long loops poll check() and
// unwind with TimeoutError once the budget is spent.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    static Deadline none() { return Deadline(); }

    static Deadline after(std::chrono::milliseconds budget) {
        return Deadline(Clock::now() + budget);
    }

    static Deadline at(Clock::time_point when) { return Deadline(when); }

    bool expired() const { return when_ && Clock::now() >= *when_; }

    void check(const std::string& stage) const {
        if (expired()) {
            throw TimeoutError(stage);
        }
    }

private:
    Deadline() = default;
    explicit Deadline(Clock::time_point when) : when_(when) {}

    std::optional<Clock::time_point> when_;
};

} // namespace image_denoiser::core
