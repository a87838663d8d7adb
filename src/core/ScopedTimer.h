#pragma once

#include <chrono>

namespace vin {

// Measures from construction. Used to log how long model loads and runs take.
class ScopedTimer {
public:
    ScopedTimer() = default;

    // in seconds, with millisecond precision
    double elapsed() const noexcept {
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_).count();
        return static_cast<double>(duration) / 1000.0;
    }

    // Audio seconds processed per second of wall time
    double speed(double audioSeconds) const noexcept {
        const auto spent = elapsed();
        return spent > 0.0 ? audioSeconds / spent : 0.0;
    }

private:
    const std::chrono::steady_clock::time_point start_time_{std::chrono::steady_clock::now()};
};

} // ns
