#include "chunkscribe/segments.hpp"

namespace chunkscribe {

namespace {

// SentencePiece word boundary marker: U+2581 (▁) encoded as 3 bytes
const std::string SP_MARKER = "\xe2\x96\x81";

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
}

bool marker_at(const std::string &s, size_t pos) {
    return pos + SP_MARKER.size() <= s.size() &&
           s.compare(pos, SP_MARKER.size(), SP_MARKER) == 0;
}

// Concatenate sub-word pieces: markers become spaces, whitespace runs
// collapse, ends are trimmed.
std::string detokenize(const std::vector<WordToken> &tokens) {
    std::string out;
    bool pending_space = false;
    for (const auto &tok : tokens) {
        const std::string &s = tok.text;
        size_t pos = 0;
        while (pos < s.size()) {
            if (marker_at(s, pos)) {
                pending_space = true;
                pos += SP_MARKER.size();
            } else if (is_space(s[pos])) {
                pending_space = true;
                ++pos;
            } else {
                if (pending_space && !out.empty())
                    out += ' ';
                pending_space = false;
                out += s[pos++];
            }
        }
    }
    return out;
}

} // namespace

bool starts_new_word(const std::string &token) {
    return (!token.empty() && is_space(token[0])) || marker_at(token, 0);
}

std::string strip_token(const std::string &token) {
    size_t begin = 0;
    size_t end = token.size();
    while (begin < end) {
        if (is_space(token[begin]))
            ++begin;
        else if (marker_at(token, begin))
            begin += SP_MARKER.size();
        else
            break;
    }
    while (end > begin) {
        if (is_space(token[end - 1]))
            --end;
        else if (end - begin >= SP_MARKER.size() &&
                 marker_at(token, end - SP_MARKER.size()))
            end -= SP_MARKER.size();
        else
            break;
    }
    return token.substr(begin, end - begin);
}

Segment make_segment(const std::vector<WordToken> &tokens, BreakPolicy policy) {
    Segment seg;
    seg.start = tokens.front().start;
    seg.end = tokens.back().end;

    for (const auto &tok : tokens) {
        std::string word = strip_token(tok.text);
        if (word.empty())
            continue;
        if (policy == BreakPolicy::Timing) {
            if (!seg.text.empty())
                seg.text += ' ';
            seg.text += word;
        }
        seg.words.push_back({std::move(word), tok.start, tok.end,
                             tok.confidence});
    }

    if (policy == BreakPolicy::WordBoundary)
        seg.text = detokenize(tokens);
    return seg;
}

std::vector<Segment> build_segments(const std::vector<WordToken> &tokens,
                                    const SegmenterConfig &config) {
    validate(config);
    if (tokens.empty())
        return {};

    std::vector<Segment> segments;
    std::vector<WordToken> current{tokens[0]};
    double segment_start = tokens[0].start;

    for (size_t i = 1; i < tokens.size(); ++i) {
        const auto &prev = tokens[i - 1];
        const auto &next = tokens[i];

        double gap = next.start - prev.end;
        double running = prev.end - segment_start;
        bool should_break =
            gap > config.gap_threshold || running > config.max_duration;
        if (should_break && config.break_policy == BreakPolicy::WordBoundary)
            should_break = starts_new_word(next.text);

        if (should_break) {
            segments.push_back(make_segment(current, config.break_policy));
            current.clear();
            segment_start = next.start;
        }
        current.push_back(next);
    }

    segments.push_back(make_segment(current, config.break_policy));
    return segments;
}

} // namespace chunkscribe
