#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkscribe/config.hpp"
#include "chunkscribe/timestamp.hpp"

namespace chunkscribe {

// ─── Transcription Engine ───────────────────────────────────────────────────

/// Word-level recognizer for one bounded mono chunk. An engine instance is an
/// exclusively owned, stateful resource: the pipeline never has two calls in
/// flight on the same instance.
class TranscriptionEngine {
  public:
    virtual ~TranscriptionEngine() = default;

    /// Words with chunk-local timestamps, in chronological order. An empty
    /// result (silence, noise) is valid. Failures throw.
    virtual std::vector<WordToken> transcribe(const std::string &audio_path) = 0;

    /// Drop transient device memory retained after a call.
    virtual void release() noexcept {}

    virtual std::string name() const = 0;
};

// ─── Engine Output Parsing ──────────────────────────────────────────────────

// Accepts a bare array of words, {"words": [...]}, or a NeMo-style
// {"timestamp": {"word": [...]}}. Each word carries "word" (or "text"),
// "start", "end" and optionally "confidence" (or "score"); missing times
// read as 0 and missing confidence as 1.0. Throws std::runtime_error on any
// other shape.
std::vector<WordToken> parse_word_tokens(const nlohmann::json &doc);

// Raw stdout of an engine command. Invalid JSON throws std::runtime_error.
std::vector<WordToken> parse_engine_output(const std::string &text);

// ─── Command Engine ─────────────────────────────────────────────────────────

/// Runs an external recognizer once per chunk:
///
///   CommandEngine engine({"nvidia/parakeet-tdt-0.6b-v3",
///                         "parakeet-words --model {model} {audio}"}, "en");
///   auto words = engine.transcribe("/tmp/_chunk_1.wav");
///
/// The command's stdout must be JSON accepted by parse_engine_output; its
/// stderr passes through. A non-zero exit status is an error.
class CommandEngine : public TranscriptionEngine {
  public:
    CommandEngine(const EngineConfig &config, std::string language);

    std::vector<WordToken> transcribe(const std::string &audio_path) override;
    std::string name() const override { return "command:" + config_.model; }

    // Command line for one chunk. A template without {audio} gets the quoted
    // path appended.
    std::string command_for(const std::string &audio_path) const;

  private:
    EngineConfig config_;
    std::string language_;
};

// Single-quote a string for /bin/sh.
std::string shell_quote(const std::string &arg);

} // namespace chunkscribe
