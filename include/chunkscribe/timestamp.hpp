#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkscribe {

// ─── Sample-Domain Types ────────────────────────────────────────────────────

// Speech region reported by voice-activity detection, in samples.
struct SpeechInterval {
    int64_t start;
    int64_t end; // exclusive

    int64_t length() const { return end - start; }
};

// One unit of audio handed to the transcription engine, in samples.
struct Chunk {
    int64_t start;
    int64_t end; // exclusive

    int64_t length() const { return end - start; }
};

inline bool operator==(const Chunk &a, const Chunk &b) {
    return a.start == b.start && a.end == b.end;
}

// ─── Word / Segment Types ───────────────────────────────────────────────────

struct WordToken {
    std::string text;
    double start;             // seconds
    double end;               // seconds
    double confidence = 1.0;  // [0, 1]
};

struct SegmentWord {
    std::string word;
    double start;
    double end;
    double score;
};

struct Segment {
    double start; // first token's start
    double end;   // last token's end
    std::string text;
    std::vector<SegmentWord> words;
};

// ─── Sample ↔ Time Conversion ───────────────────────────────────────────────

constexpr int DEFAULT_SAMPLE_RATE = 16000;

inline double samples_to_seconds(int64_t samples, int sample_rate) {
    return static_cast<double>(samples) / static_cast<double>(sample_rate);
}

// Rounds to the nearest sample.
int64_t seconds_to_samples(double seconds, int sample_rate);

// Round to a fixed number of decimal places, exactly as the value is stored:
// 0.0625 -> 0.062, 0.1875 -> 0.188, 1.0005 -> 1.0 (1.0005 is just below).
double round_to(double value, int decimals);

constexpr int TIME_DECIMALS = 3;
constexpr int SCORE_DECIMALS = 4;

} // namespace chunkscribe
