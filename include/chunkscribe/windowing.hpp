#pragma once

#include <cstdint>
#include <vector>

#include "chunkscribe/config.hpp"
#include "chunkscribe/timestamp.hpp"

namespace chunkscribe {

// ─── Fixed Windowing ────────────────────────────────────────────────────────

// Fixed windows of chunk_duration whose starts are chunk_duration - overlap
// apart. The window that reaches the end of the audio is truncated there and
// is the last one. Words recognized twice inside an overlap are kept twice.
//
//   fixed_windows(620 * 16000, 16000, {300, 5})
//     -> starts at 0s, 295s, 590s; the last window is 30s long
//
// Throws ConfigError when overlap >= chunk_duration.
std::vector<Chunk> fixed_windows(int64_t total_samples, int sample_rate,
                                 const WindowConfig &config);

} // namespace chunkscribe
