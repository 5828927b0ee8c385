#pragma once

#include <filesystem>
#include <string>

#include <axiom/axiom.hpp>

#include "chunkscribe/engine.hpp"

namespace chunkscribe {

// ─── Chunk Staging ──────────────────────────────────────────────────────────

/// One chunk written to disk for the engine. The file is removed when the
/// object goes out of scope, on success and on failure alike; a file that
/// is already gone is not an error.
class StagedChunk {
  public:
    StagedChunk(const std::filesystem::path &dir, size_t index,
                const axiom::Tensor &samples, int sample_rate);
    ~StagedChunk();

    StagedChunk(const StagedChunk &) = delete;
    StagedChunk &operator=(const StagedChunk &) = delete;

    const std::filesystem::path &path() const { return path_; }

  private:
    std::filesystem::path path_;
};

/// Calls engine.release() when the scope ends.
class EngineLease {
  public:
    explicit EngineLease(TranscriptionEngine &engine) : engine_(engine) {}
    ~EngineLease() { engine_.release(); }

    EngineLease(const EngineLease &) = delete;
    EngineLease &operator=(const EngineLease &) = delete;

    TranscriptionEngine *operator->() const { return &engine_; }

  private:
    TranscriptionEngine &engine_;
};

// Directory for staged chunks: the configured path, or a per-process
// directory under the system temp dir. Created if missing.
std::filesystem::path resolve_staging_dir(const std::string &configured);

// File name used for chunk `index` (0-based): _chunk_<index+1>.wav
std::string staged_file_name(size_t index);

} // namespace chunkscribe
