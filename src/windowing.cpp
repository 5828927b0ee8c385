#include "chunkscribe/windowing.hpp"

#include <algorithm>
#include <limits>

#include "chunkscribe/errors.hpp"

namespace chunkscribe {

std::vector<Chunk> fixed_windows(int64_t total_samples, int sample_rate,
                                 const WindowConfig &config) {
    validate(config);
    if (sample_rate <= 0) {
        throw ConfigError("sample_rate must be positive");
    }
    if (total_samples < 0) {
        throw InputError("negative audio length");
    }

    // llround is unspecified past int64_t range
    double max_seconds =
        static_cast<double>(std::numeric_limits<int64_t>::max() / 2) /
        sample_rate;
    if (config.chunk_duration >= max_seconds) {
        throw ConfigError("chunk_duration (" +
                          std::to_string(config.chunk_duration) +
                          "s) exceeds the sample range at " +
                          std::to_string(sample_rate) + " Hz");
    }

    int64_t window = seconds_to_samples(config.chunk_duration, sample_rate);
    int64_t stride = seconds_to_samples(
        config.chunk_duration - config.overlap, sample_rate);
    if (window <= 0 || stride <= 0) {
        throw ConfigError("chunk_duration - overlap is shorter than one "
                          "sample at " +
                          std::to_string(sample_rate) + " Hz");
    }

    std::vector<Chunk> chunks;
    for (int64_t start = 0; start < total_samples; start += stride) {
        int64_t end = std::min(start + window, total_samples);
        chunks.push_back({start, end});
        if (end == total_samples)
            break;
    }
    return chunks;
}

} // namespace chunkscribe
