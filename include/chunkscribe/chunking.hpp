#pragma once

#include <memory>
#include <vector>

#include <axiom/axiom.hpp>

#include "chunkscribe/config.hpp"
#include "chunkscribe/timestamp.hpp"
#include "chunkscribe/vad.hpp"

namespace chunkscribe {

// ─── Chunking Strategies ────────────────────────────────────────────────────

/// Produces the ordered chunk list for one audio buffer.
class ChunkingStrategy {
  public:
    virtual ~ChunkingStrategy() = default;

    virtual std::vector<Chunk> plan(const axiom::Tensor &samples,
                                    int sample_rate) = 0;
    virtual const char *name() const = 0;
};

/// Speech intervals from a detector, consolidated into bounded chunks.
class VadChunking : public ChunkingStrategy {
  public:
    VadChunking(VoiceActivityDetector &vad, const ConsolidatorConfig &config);

    std::vector<Chunk> plan(const axiom::Tensor &samples,
                            int sample_rate) override;
    const char *name() const override { return "vad"; }

    // Raw interval count seen by the last plan() call.
    size_t last_interval_count() const { return last_interval_count_; }

  private:
    VoiceActivityDetector &vad_;
    ConsolidatorConfig config_;
    size_t last_interval_count_ = 0;
};

/// Fixed, possibly overlapping windows over the whole timeline.
class WindowChunking : public ChunkingStrategy {
  public:
    explicit WindowChunking(const WindowConfig &config);

    std::vector<Chunk> plan(const axiom::Tensor &samples,
                            int sample_rate) override;
    const char *name() const override { return "window"; }

  private:
    WindowConfig config_;
};

// Strategy for config.mode. The detector is only used in VAD mode and must
// outlive the returned strategy.
std::unique_ptr<ChunkingStrategy>
make_chunking_strategy(const PipelineConfig &config,
                       VoiceActivityDetector &vad);

} // namespace chunkscribe
