#pragma once

#include <string>
#include <vector>

#include "chunkscribe/config.hpp"
#include "chunkscribe/timestamp.hpp"

namespace chunkscribe {

// ─── Token Text Helpers ─────────────────────────────────────────────────────

// True when the token opens a new orthographic word: it begins with
// whitespace or the SentencePiece marker U+2581 (▁).
bool starts_new_word(const std::string &token);

// Token text without surrounding whitespace and boundary markers.
std::string strip_token(const std::string &token);

// ─── Segment Builder ────────────────────────────────────────────────────────

// Finalize a non-empty run of tokens into one segment. start/end come from
// the first/last token even when those tokens are empty; empty tokens are
// left out of words and text.
Segment make_segment(const std::vector<WordToken> &tokens,
                     BreakPolicy policy = BreakPolicy::Timing);

// Split a chronologically ordered token stream into segments. A break goes
// before token i when
//
//   tokens[i].start - tokens[i-1].end > gap_threshold, or
//   tokens[i-1].end - segment_start   > max_duration
//
// and, under BreakPolicy::WordBoundary, tokens[i] starts a new word.
// Segments partition the input in order; empty input gives no segments.
std::vector<Segment> build_segments(const std::vector<WordToken> &tokens,
                                    const SegmenterConfig &config = {});

} // namespace chunkscribe
