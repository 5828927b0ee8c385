#include "chunkscribe/chunking.hpp"

#include <iostream>

#include "chunkscribe/intervals.hpp"
#include "chunkscribe/windowing.hpp"

namespace chunkscribe {

VadChunking::VadChunking(VoiceActivityDetector &vad,
                         const ConsolidatorConfig &config)
    : vad_(vad), config_(config) {
    validate(config_);
}

std::vector<Chunk> VadChunking::plan(const axiom::Tensor &samples,
                                     int sample_rate) {
    auto intervals = vad_.detect(samples, sample_rate);
    last_interval_count_ = intervals.size();
    if (intervals.empty() && samples.shape()[0] > 0) {
        std::cerr << "[vad] no speech detected in "
                  << samples_to_seconds(
                         static_cast<int64_t>(samples.shape()[0]), sample_rate)
                  << "s of audio" << std::endl;
    }
    return consolidate_intervals(intervals, sample_rate, config_);
}

WindowChunking::WindowChunking(const WindowConfig &config) : config_(config) {
    validate(config_);
}

std::vector<Chunk> WindowChunking::plan(const axiom::Tensor &samples,
                                        int sample_rate) {
    auto total = static_cast<int64_t>(samples.shape()[0]);
    return fixed_windows(total, sample_rate, config_);
}

std::unique_ptr<ChunkingStrategy>
make_chunking_strategy(const PipelineConfig &config,
                       VoiceActivityDetector &vad) {
    if (config.mode == ChunkingMode::Window)
        return std::make_unique<WindowChunking>(config.window);
    return std::make_unique<VadChunking>(vad, config.consolidator);
}

} // namespace chunkscribe
