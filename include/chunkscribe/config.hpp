#pragma once

#include <limits>
#include <string>

#include "chunkscribe/timestamp.hpp"

namespace chunkscribe {

// ─── Interval Consolidator Config ───────────────────────────────────────────

struct ConsolidatorConfig {
    double merge_gap = 10.0;  // gaps shorter than this are absorbed (s)
    double max_chunk = 300.0; // soft upper bound on chunk duration (s)
    double split_gap = 1.0;   // smallest pause a long chunk may split at (s)
};

// ─── Fixed Window Config ────────────────────────────────────────────────────

struct WindowConfig {
    double chunk_duration = 300.0; // seconds
    double overlap = 5.0;          // seconds, must be < chunk_duration
};

// ─── Segment Builder Config ─────────────────────────────────────────────────

enum class BreakPolicy {
    Timing,       // every token is a valid break point
    WordBoundary, // break only before tokens that start a new word
};

struct SegmenterConfig {
    double gap_threshold = 0.4; // pause that forces a break (s)
    double max_duration = 10.0; // running duration that forces a break (s)
    BreakPolicy break_policy = BreakPolicy::Timing;
};

// ─── Voice Activity Detection Config ────────────────────────────────────────

struct VadConfig {
    float threshold = 0.02f; // RMS floor, raised by the adaptive estimate
    int min_speech_duration_ms = 250;
    int min_silence_duration_ms = 100;
    int speech_pad_ms = 30;
    int frame_ms = 32;
    bool adaptive_threshold = true;
    float noise_floor_percentile = 0.1f;
};

// ─── Engine Config ──────────────────────────────────────────────────────────

struct EngineConfig {
    std::string model = "nvidia/parakeet-tdt-0.6b-v3";
    // Run once per staged chunk. {audio}, {model} and {language} are
    // substituted; stdout must be the JSON word list.
    std::string command;
};

// ─── Pipeline Config ────────────────────────────────────────────────────────

enum class ChunkingMode { Vad, Window };

enum class ChunkErrorPolicy {
    Abort, // first failing chunk fails the run
    Skip,  // failing chunk contributes no words, run continues
};

struct PipelineConfig {
    ChunkingMode mode = ChunkingMode::Vad;
    ConsolidatorConfig consolidator;
    WindowConfig window;
    SegmenterConfig segmenter;
    VadConfig vad;
    EngineConfig engine;
    std::string language = "en";
    std::string staging_dir; // empty = system temp directory
    int sample_rate = DEFAULT_SAMPLE_RATE;
    ChunkErrorPolicy on_chunk_error = ChunkErrorPolicy::Abort;
};

// ─── Presets ────────────────────────────────────────────────────────────────

// Parakeet TDT 0.6B with energy VAD: 400ms pause / 10s segment cap.
inline PipelineConfig make_default_config() { return PipelineConfig{}; }

// Fixed 5-minute windows overlapping by 5 seconds.
inline PipelineConfig make_window_config() {
    PipelineConfig cfg;
    cfg.mode = ChunkingMode::Window;
    cfg.window.chunk_duration = 300.0;
    cfg.window.overlap = 5.0;
    return cfg;
}

constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

// ─── Validation ─────────────────────────────────────────────────────────────

// Throw ConfigError describing the first invalid field.
void validate(const ConsolidatorConfig &config);
void validate(const WindowConfig &config);
void validate(const SegmenterConfig &config);
void validate(const VadConfig &config);
void validate(const PipelineConfig &config);

const char *to_string(ChunkingMode mode);
const char *to_string(BreakPolicy policy);
const char *to_string(ChunkErrorPolicy policy);

// Parse CLI spellings ("vad", "window", "timing", "word-boundary", ...).
ChunkingMode parse_chunking_mode(const std::string &name);
BreakPolicy parse_break_policy(const std::string &name);
ChunkErrorPolicy parse_chunk_error_policy(const std::string &name);

} // namespace chunkscribe
