#pragma once

#include <chrono>
#include <string>

class DurationUtils {
public:
    using Duration = std::chrono::nanoseconds;

    // Parse "300ms", "1.5s", "1h15m", "-2s" or "0". Units: ns, us, ms, s, m, h.
    static Duration parse(const std::string& text);

    // Render with the largest unit that represents the value exactly
    static std::string format(Duration duration);

    static double to_seconds(Duration duration) {
        return std::chrono::duration<double>(duration).count();
    }
};
