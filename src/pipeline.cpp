#include "chunkscribe/pipeline.hpp"

#include <iostream>
#include <system_error>

#include "chunkscribe/errors.hpp"
#include "chunkscribe/segments.hpp"
#include "chunkscribe/staging.hpp"

namespace chunkscribe {

namespace {

// Removes a per-run staging directory once it is empty again.
class ScopedStagingDir {
  public:
    ScopedStagingDir(std::filesystem::path dir, bool owned)
        : dir_(std::move(dir)), owned_(owned) {}
    ~ScopedStagingDir() {
        if (owned_) {
            std::error_code ec;
            std::filesystem::remove(dir_, ec); // only succeeds when empty
        }
    }

    ScopedStagingDir(const ScopedStagingDir &) = delete;
    ScopedStagingDir &operator=(const ScopedStagingDir &) = delete;

    const std::filesystem::path &path() const { return dir_; }

  private:
    std::filesystem::path dir_;
    bool owned_;
};

} // namespace

std::vector<WordToken> to_global_time(const std::vector<WordToken> &local,
                                      double offset_seconds) {
    std::vector<WordToken> out;
    out.reserve(local.size());
    for (const auto &w : local) {
        out.push_back({w.text,
                       round_to(w.start + offset_seconds, TIME_DECIMALS),
                       round_to(w.end + offset_seconds, TIME_DECIMALS),
                       round_to(w.confidence, SCORE_DECIMALS)});
    }
    return out;
}

Pipeline::Pipeline(const PipelineConfig &config, ChunkingStrategy &chunker,
                   TranscriptionEngine &engine)
    : config_(config), chunker_(chunker), engine_(engine) {
    validate(config_);
}

PipelineResult Pipeline::run(const AudioData &audio) {
    return run(audio.samples, audio.sample_rate);
}

PipelineResult Pipeline::run(const axiom::Tensor &samples, int sample_rate) {
    if (sample_rate != config_.sample_rate) {
        throw InputError("audio is " + std::to_string(sample_rate) +
                         " Hz, pipeline expects " +
                         std::to_string(config_.sample_rate) + " Hz");
    }

    PipelineResult result;
    result.transcript.language = config_.language;
    result.stats.audio_seconds = samples_to_seconds(
        static_cast<int64_t>(samples.shape()[0]), sample_rate);

    result.chunks = chunker_.plan(samples, sample_rate);
    result.stats.chunks = result.chunks.size();
    if (result.chunks.empty())
        return result;

    ScopedStagingDir dir(resolve_staging_dir(config_.staging_dir),
                         config_.staging_dir.empty());

    for (size_t i = 0; i < result.chunks.size(); ++i) {
        const auto &chunk = result.chunks[i];
        auto slice = slice_samples(samples, chunk.start, chunk.end);
        double offset = samples_to_seconds(chunk.start, sample_rate);
        result.stats.chunked_seconds +=
            samples_to_seconds(chunk.length(), sample_rate);

        ChunkProgress progress{i,
                               result.chunks.size(),
                               offset,
                               samples_to_seconds(chunk.end, sample_rate),
                               0};
        try {
            auto local = transcribe_chunk(slice, i, dir.path());
            auto words = to_global_time(local, offset);
            progress.words = words.size();
            result.words.insert(result.words.end(), words.begin(),
                                words.end());
        } catch (const std::exception &e) {
            if (config_.on_chunk_error == ChunkErrorPolicy::Abort)
                throw TranscriptionError(i, e.what());
            std::cerr << "[pipeline] chunk " << i + 1 << "/"
                      << result.chunks.size()
                      << " failed, continuing without it: " << e.what()
                      << std::endl;
            progress.failed = true;
            ++result.stats.failed_chunks;
        }

        if (progress_)
            progress_(progress);
    }

    result.stats.words = result.words.size();
    result.transcript.segments =
        build_segments(result.words, config_.segmenter);
    return result;
}

std::vector<WordToken>
Pipeline::transcribe_chunk(const axiom::Tensor &slice, size_t index,
                           const std::filesystem::path &dir) {
    // Destruction order: staged file first, then engine memory.
    EngineLease engine(engine_);
    StagedChunk staged(dir, index, slice, config_.sample_rate);
    return engine->transcribe(staged.path().string());
}

} // namespace chunkscribe
