#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <axiom/axiom.hpp>

#include "chunkscribe/audio_io.hpp"
#include "chunkscribe/chunking.hpp"
#include "chunkscribe/config.hpp"
#include "chunkscribe/engine.hpp"
#include "chunkscribe/timestamp.hpp"

namespace chunkscribe {

// ─── Pipeline Result Types ──────────────────────────────────────────────────

struct Transcript {
    std::vector<Segment> segments;
    std::string language;
};

struct ChunkProgress {
    size_t index; // 0-based
    size_t count;
    double start; // seconds
    double end;   // seconds
    size_t words;
    bool failed = false;
};

using ProgressCallback = std::function<void(const ChunkProgress &)>;

struct PipelineStats {
    size_t chunks = 0;
    size_t failed_chunks = 0;
    size_t words = 0;
    double audio_seconds = 0.0;
    double chunked_seconds = 0.0; // summed chunk lengths, overlaps counted
};

struct PipelineResult {
    Transcript transcript;
    std::vector<WordToken> words; // global timeline, rounded
    std::vector<Chunk> chunks;
    PipelineStats stats;
};

// ─── Pipeline ───────────────────────────────────────────────────────────────

/// Chunk → transcribe → re-time → segment, strictly one chunk at a time.
///
///   EnergyVad vad(cfg.vad);
///   auto chunker = make_chunking_strategy(cfg, vad);
///   CommandEngine engine(cfg.engine, cfg.language);
///   Pipeline pipeline(cfg, *chunker, engine);
///   auto result = pipeline.run(read_audio("talk.mp3"));
///
/// The chunker and engine are borrowed and must outlive the pipeline. Each
/// chunk's staged file and the engine's transient memory are released
/// before the next chunk starts.
class Pipeline {
  public:
    /// Throws ConfigError if the configuration is invalid.
    Pipeline(const PipelineConfig &config, ChunkingStrategy &chunker,
             TranscriptionEngine &engine);

    void on_progress(ProgressCallback callback) {
        progress_ = std::move(callback);
    }

    PipelineResult run(const AudioData &audio);

    /// samples must be mono at config().sample_rate.
    PipelineResult run(const axiom::Tensor &samples, int sample_rate);

    const PipelineConfig &config() const { return config_; }

  private:
    PipelineConfig config_;
    ChunkingStrategy &chunker_;
    TranscriptionEngine &engine_;
    ProgressCallback progress_;

    std::vector<WordToken> transcribe_chunk(const axiom::Tensor &slice,
                                            size_t index,
                                            const std::filesystem::path &dir);
};

// Shift chunk-local tokens onto the global timeline and round them
// (3 decimals for times, 4 for confidence).
std::vector<WordToken> to_global_time(const std::vector<WordToken> &local,
                                      double offset_seconds);

} // namespace chunkscribe
