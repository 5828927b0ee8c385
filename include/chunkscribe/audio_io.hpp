#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <axiom/axiom.hpp>

#include "chunkscribe/timestamp.hpp"

namespace chunkscribe {

enum class AudioFormat { Unknown, WAV, FLAC, MP3, OGG };

struct AudioData {
    axiom::Tensor samples;    // float32, (num_samples,), mono, [-1,1]
    int sample_rate;          // target rate after read_audio
    int original_sample_rate; // source rate before resampling
    int num_channels;         // source channel count before downmix
    int64_t num_samples;      // = samples.shape()[0]
    double duration;          // seconds
    AudioFormat format;
};

// ─── Loading ────────────────────────────────────────────────────────────────

// Decode a file (format from extension, then magic bytes), downmix to mono
// and resample. Throws InputError if the file is missing or undecodable.
AudioData read_audio(const std::string &path,
                     int target_sample_rate = DEFAULT_SAMPLE_RATE);

// Raw float32 mono PCM already in memory.
AudioData read_audio(const float *pcm, size_t num_samples, int sample_rate,
                     int target_sample_rate = DEFAULT_SAMPLE_RATE);

axiom::Tensor resample(const axiom::Tensor &samples, int src_rate,
                       int dst_rate);

AudioFormat detect_format_by_extension(const std::string &path);
AudioFormat detect_format_by_magic(const uint8_t *data, size_t len);

// ─── Chunk Extraction ───────────────────────────────────────────────────────

// Copy of samples[start, end). Throws InputError when out of range.
axiom::Tensor slice_samples(const axiom::Tensor &samples, int64_t start,
                            int64_t end);

// Write mono 16-bit PCM WAV. Samples are clipped to [-1, 1].
void write_wav(const std::string &path, const axiom::Tensor &samples,
               int sample_rate);

} // namespace chunkscribe
