#pragma once

#include <stdexcept>
#include <string>

namespace chunkscribe {

// ─── Error Types ────────────────────────────────────────────────────────────

// Invalid parameter combination. Always raised before any chunk is processed.
class ConfigError : public std::invalid_argument {
  public:
    explicit ConfigError(const std::string &what)
        : std::invalid_argument(what) {}
};

// Missing, unreadable or malformed input (audio files, interval lists).
class InputError : public std::runtime_error {
  public:
    explicit InputError(const std::string &what) : std::runtime_error(what) {}
};

// The transcription engine failed on one chunk.
class TranscriptionError : public std::runtime_error {
  public:
    TranscriptionError(size_t chunk_index, const std::string &what)
        : std::runtime_error("chunk " + std::to_string(chunk_index + 1) +
                             ": " + what),
          chunk_index_(chunk_index) {}

    size_t chunk_index() const { return chunk_index_; }

  private:
    size_t chunk_index_;
};

} // namespace chunkscribe
