#include "chunkscribe/timestamp.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace chunkscribe {

int64_t seconds_to_samples(double seconds, int sample_rate) {
    return static_cast<int64_t>(
        std::llround(seconds * static_cast<double>(sample_rate)));
}

double round_to(double value, int decimals) {
    if (!std::isfinite(value))
        return value;
    // printf rounds the exact binary value, ties to even.
    char buf[352];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return std::strtod(buf, nullptr);
}

} // namespace chunkscribe
