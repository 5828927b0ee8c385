#include "chunkscribe/intervals.hpp"

#include <cstddef>

#include "chunkscribe/errors.hpp"

namespace chunkscribe {

namespace {

// Inclusive index range of source intervals merged into one chunk.
struct IntervalRun {
    size_t first;
    size_t last;
};

std::vector<IntervalRun>
merge_runs(const std::vector<SpeechInterval> &intervals, int sample_rate,
           double merge_gap) {
    std::vector<IntervalRun> runs;
    if (intervals.empty())
        return runs;

    IntervalRun current{0, 0};
    for (size_t i = 1; i < intervals.size(); ++i) {
        double gap = samples_to_seconds(
            intervals[i].start - intervals[current.last].end, sample_rate);
        if (gap < merge_gap) {
            current.last = i;
        } else {
            runs.push_back(current);
            current = IntervalRun{i, i};
        }
    }
    runs.push_back(current);
    return runs;
}

void check_sample_rate(int sample_rate) {
    if (sample_rate <= 0) {
        throw ConfigError("sample_rate must be positive");
    }
}

} // namespace

void check_intervals(const std::vector<SpeechInterval> &intervals) {
    for (size_t i = 0; i < intervals.size(); ++i) {
        const auto &iv = intervals[i];
        if (iv.start < 0 || iv.end <= iv.start) {
            throw InputError("speech interval " + std::to_string(i) +
                             " is empty or negative: [" +
                             std::to_string(iv.start) + ", " +
                             std::to_string(iv.end) + ")");
        }
        if (i > 0 && iv.start < intervals[i - 1].end) {
            throw InputError("speech interval " + std::to_string(i) +
                             " overlaps or precedes its predecessor");
        }
    }
}

std::vector<Chunk> merge_intervals(const std::vector<SpeechInterval> &intervals,
                                   int sample_rate, double merge_gap) {
    check_sample_rate(sample_rate);

    std::vector<Chunk> chunks;
    for (const auto &run : merge_runs(intervals, sample_rate, merge_gap)) {
        chunks.push_back({intervals[run.first].start, intervals[run.last].end});
    }
    return chunks;
}

std::vector<Chunk> split_chunk(const std::vector<SpeechInterval> &constituents,
                               int sample_rate, double max_chunk,
                               double split_gap) {
    check_sample_rate(sample_rate);
    if (constituents.empty())
        return {};

    std::vector<Chunk> pieces;
    Chunk current{constituents[0].start, constituents[0].end};

    for (size_t i = 1; i < constituents.size(); ++i) {
        const auto &next = constituents[i];
        double gap = samples_to_seconds(next.start - constituents[i - 1].end,
                                        sample_rate);
        double running = samples_to_seconds(next.end - current.start,
                                            sample_rate);

        if (running > max_chunk && gap >= split_gap) {
            pieces.push_back(current);
            current = Chunk{next.start, next.end};
        } else {
            current.end = next.end;
        }
    }
    pieces.push_back(current);
    return pieces;
}

std::vector<Chunk>
consolidate_intervals(const std::vector<SpeechInterval> &intervals,
                      int sample_rate, const ConsolidatorConfig &config) {
    validate(config);
    check_sample_rate(sample_rate);
    check_intervals(intervals);

    std::vector<Chunk> chunks;
    for (const auto &run :
         merge_runs(intervals, sample_rate, config.merge_gap)) {
        Chunk merged{intervals[run.first].start, intervals[run.last].end};
        double duration = samples_to_seconds(merged.length(), sample_rate);

        if (duration <= config.max_chunk || run.first == run.last) {
            chunks.push_back(merged);
            continue;
        }

        std::vector<SpeechInterval> constituents(
            intervals.begin() + static_cast<std::ptrdiff_t>(run.first),
            intervals.begin() + static_cast<std::ptrdiff_t>(run.last) + 1);
        auto pieces = split_chunk(constituents, sample_rate, config.max_chunk,
                                  config.split_gap);
        chunks.insert(chunks.end(), pieces.begin(), pieces.end());
    }
    return chunks;
}

} // namespace chunkscribe
