#include "chunkscribe/vad.hpp"

#include <algorithm>
#include <cmath>

namespace chunkscribe {

EnergyVad::EnergyVad(const VadConfig &config) : config_(config) {
    validate(config_);
}

float EnergyVad::pick_threshold(const std::vector<float> &energies) const {
    if (!config_.adaptive_threshold || energies.empty())
        return config_.threshold;

    std::vector<float> sorted = energies;
    std::sort(sorted.begin(), sorted.end());
    auto at = [&](float q) {
        auto idx = static_cast<size_t>(static_cast<float>(sorted.size()) * q);
        return sorted[std::min(idx, sorted.size() - 1)];
    };

    float noise = at(config_.noise_floor_percentile);
    float speech = at(0.9f);
    float range = speech - noise;

    // A quarter of the way from noise to speech, at least twice the noise
    // floor but not past the midpoint. The configured floor always holds.
    float threshold = std::max(noise + range * 0.25f, noise * 2.0f);
    threshold = std::min(threshold, noise + range * 0.5f);
    return std::max(threshold, config_.threshold);
}

std::vector<SpeechInterval> EnergyVad::detect(const axiom::Tensor &samples,
                                              int sample_rate) {
    auto cont = samples.ascontiguousarray();
    auto total = static_cast<int64_t>(cont.shape()[0]);
    const float *data = cont.typed_data<float>();

    int64_t frame = std::max<int64_t>(
        1, static_cast<int64_t>(sample_rate) * config_.frame_ms / 1000);
    int64_t hop = std::max<int64_t>(1, frame / 2);
    if (total < frame)
        return {};

    std::vector<float> energies;
    std::vector<int64_t> starts;
    for (int64_t s = 0; s + frame <= total; s += hop) {
        double sum_sq = 0.0;
        for (int64_t i = s; i < s + frame; ++i)
            sum_sq += static_cast<double>(data[i]) * data[i];
        energies.push_back(
            static_cast<float>(std::sqrt(sum_sq / static_cast<double>(frame))));
        starts.push_back(s);
    }

    last_threshold_ = pick_threshold(energies);

    std::vector<SpeechInterval> raw;
    bool in_speech = false;
    int64_t region_start = 0;
    for (size_t i = 0; i < energies.size(); ++i) {
        bool speech = energies[i] > last_threshold_;
        if (speech && !in_speech) {
            region_start = starts[i];
            in_speech = true;
        } else if (!speech && in_speech) {
            raw.push_back({region_start, starts[i - 1] + frame});
            in_speech = false;
        }
    }
    if (in_speech)
        raw.push_back({region_start, total});

    return finalize_speech_regions(raw, total, sample_rate, config_);
}

std::vector<SpeechInterval>
finalize_speech_regions(const std::vector<SpeechInterval> &raw,
                        int64_t total_samples, int sample_rate,
                        const VadConfig &config) {
    if (raw.empty())
        return {};

    auto ms = [sample_rate](int v) {
        return static_cast<int64_t>(sample_rate) * v / 1000;
    };
    int64_t min_silence = ms(config.min_silence_duration_ms);
    int64_t min_speech = ms(config.min_speech_duration_ms);
    int64_t pad = ms(config.speech_pad_ms);

    std::vector<SpeechInterval> merged;
    SpeechInterval current = raw[0];
    for (size_t i = 1; i < raw.size(); ++i) {
        if (raw[i].start - current.end < min_silence) {
            current.end = std::max(current.end, raw[i].end);
        } else {
            merged.push_back(current);
            current = raw[i];
        }
    }
    merged.push_back(current);

    std::vector<SpeechInterval> kept;
    for (const auto &r : merged) {
        if (r.length() >= min_speech)
            kept.push_back(r);
    }

    std::vector<SpeechInterval> out;
    for (size_t i = 0; i < kept.size(); ++i) {
        int64_t lo = out.empty() ? 0 : out.back().end;
        int64_t hi = i + 1 < kept.size() ? kept[i + 1].start : total_samples;
        int64_t start = std::max(lo, kept[i].start - pad);
        int64_t end = std::min(hi, kept[i].end + pad);
        end = std::min(end, total_samples);
        if (end > start)
            out.push_back({start, end});
    }
    return out;
}

} // namespace chunkscribe
