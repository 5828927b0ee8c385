#include "chunkscribe/config.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

#include "chunkscribe/errors.hpp"

namespace chunkscribe {

namespace {

void require_non_negative(double value, const char *name) {
    if (std::isnan(value) || value < 0.0) {
        throw ConfigError(std::string(name) +
                          " must be a non-negative number of seconds");
    }
}

void require_positive(double value, const char *name) {
    if (std::isnan(value) || value <= 0.0) {
        throw ConfigError(std::string(name) + " must be positive");
    }
}

} // namespace

void validate(const ConsolidatorConfig &config) {
    require_non_negative(config.merge_gap, "merge_gap");
    require_positive(config.max_chunk, "max_chunk");
    require_non_negative(config.split_gap, "split_gap");
}

void validate(const WindowConfig &config) {
    require_positive(config.chunk_duration, "chunk_duration");
    require_non_negative(config.overlap, "overlap");
    if (std::isinf(config.chunk_duration)) {
        throw ConfigError("chunk_duration must be finite");
    }
    if (config.overlap >= config.chunk_duration) {
        throw ConfigError("overlap (" + std::to_string(config.overlap) +
                          "s) must be shorter than chunk_duration (" +
                          std::to_string(config.chunk_duration) + "s)");
    }
}

void validate(const SegmenterConfig &config) {
    // +inf is allowed for both: it disables that break rule.
    require_non_negative(config.gap_threshold, "gap_threshold");
    require_non_negative(config.max_duration, "max_duration");
}

void validate(const VadConfig &config) {
    if (config.min_speech_duration_ms < 0 ||
        config.min_silence_duration_ms < 0 || config.speech_pad_ms < 0) {
        throw ConfigError("VAD durations must be non-negative");
    }
    if (config.frame_ms <= 0) {
        throw ConfigError("VAD frame_ms must be positive");
    }
    if (config.threshold < 0.0f) {
        throw ConfigError("VAD threshold must be non-negative");
    }
    if (config.noise_floor_percentile < 0.0f ||
        config.noise_floor_percentile > 1.0f) {
        throw ConfigError("VAD noise_floor_percentile must be in [0, 1]");
    }
}

void validate(const PipelineConfig &config) {
    if (config.sample_rate <= 0) {
        throw ConfigError("sample_rate must be positive");
    }
    if (config.mode == ChunkingMode::Vad) {
        validate(config.consolidator);
        validate(config.vad);
    } else {
        validate(config.window);
        double max_seconds =
            static_cast<double>(std::numeric_limits<int64_t>::max() / 2) /
            config.sample_rate;
        if (config.window.chunk_duration >= max_seconds) {
            throw ConfigError("chunk_duration does not fit in samples at " +
                              std::to_string(config.sample_rate) + " Hz");
        }
    }
    validate(config.segmenter);
}

const char *to_string(ChunkingMode mode) {
    return mode == ChunkingMode::Vad ? "vad" : "window";
}

const char *to_string(BreakPolicy policy) {
    return policy == BreakPolicy::Timing ? "timing" : "word-boundary";
}

const char *to_string(ChunkErrorPolicy policy) {
    return policy == ChunkErrorPolicy::Abort ? "abort" : "skip";
}

ChunkingMode parse_chunking_mode(const std::string &name) {
    if (name == "vad")
        return ChunkingMode::Vad;
    if (name == "window" || name == "fixed")
        return ChunkingMode::Window;
    throw ConfigError("unknown chunking mode: " + name);
}

BreakPolicy parse_break_policy(const std::string &name) {
    if (name == "timing")
        return BreakPolicy::Timing;
    if (name == "word-boundary" || name == "word_boundary")
        return BreakPolicy::WordBoundary;
    throw ConfigError("unknown break policy: " + name);
}

ChunkErrorPolicy parse_chunk_error_policy(const std::string &name) {
    if (name == "abort")
        return ChunkErrorPolicy::Abort;
    if (name == "skip")
        return ChunkErrorPolicy::Skip;
    throw ConfigError("unknown chunk error policy: " + name);
}

} // namespace chunkscribe
