#pragma once

#include <vector>

#include "chunkscribe/config.hpp"
#include "chunkscribe/timestamp.hpp"

namespace chunkscribe {

// ─── Interval Consolidation ─────────────────────────────────────────────────
//
// Turns VAD speech intervals into transcription chunks in two passes:
//
//   merge  absorb every interval whose gap to the running chunk is
//          strictly shorter than merge_gap
//   split  re-split merged chunks longer than max_chunk, only at original
//          pauses of at least split_gap
//
// A chunk backed by one interval is never split, so max_chunk is a soft
// bound when the speaker never pauses.

// Throws InputError unless intervals are non-empty ranges (end > start >= 0),
// ascending and non-overlapping. Touching ranges are allowed.
void check_intervals(const std::vector<SpeechInterval> &intervals);

// Merge pass only.
std::vector<Chunk> merge_intervals(const std::vector<SpeechInterval> &intervals,
                                   int sample_rate, double merge_gap);

// Split pass over the constituent intervals of one merged chunk.
std::vector<Chunk> split_chunk(const std::vector<SpeechInterval> &constituents,
                               int sample_rate, double max_chunk,
                               double split_gap);

// Both passes. Validates config and input first.
std::vector<Chunk>
consolidate_intervals(const std::vector<SpeechInterval> &intervals,
                      int sample_rate, const ConsolidatorConfig &config);

} // namespace chunkscribe
