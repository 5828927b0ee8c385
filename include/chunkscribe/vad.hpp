#pragma once

#include <cstdint>
#include <vector>

#include <axiom/axiom.hpp>

#include "chunkscribe/config.hpp"
#include "chunkscribe/timestamp.hpp"

namespace chunkscribe {

// ─── Voice Activity Detection ───────────────────────────────────────────────

/// Finds speech in a mono waveform. Implementations behave as pure functions
/// of the audio: intervals come back ascending, non-overlapping and inside
/// [0, num_samples).
class VoiceActivityDetector {
  public:
    virtual ~VoiceActivityDetector() = default;

    virtual std::vector<SpeechInterval> detect(const axiom::Tensor &samples,
                                               int sample_rate) = 0;
};

/// RMS energy detector with an adaptive threshold between the noise floor
/// and the speech level. Works best on clean speech with real pauses
/// (lectures, podcasts, meetings).
class EnergyVad : public VoiceActivityDetector {
  public:
    explicit EnergyVad(const VadConfig &config = {});

    std::vector<SpeechInterval> detect(const axiom::Tensor &samples,
                                       int sample_rate) override;

    // Threshold picked by the last detect() call.
    float last_threshold() const { return last_threshold_; }

  private:
    VadConfig config_;
    float last_threshold_ = 0.0f;

    float pick_threshold(const std::vector<float> &energies) const;
};

// Shared post-processing: merge regions separated by less than
// min_silence_duration_ms, drop regions shorter than min_speech_duration_ms,
// pad by speech_pad_ms without crossing neighbours or the audio bounds.
std::vector<SpeechInterval>
finalize_speech_regions(const std::vector<SpeechInterval> &raw,
                        int64_t total_samples, int sample_rate,
                        const VadConfig &config);

} // namespace chunkscribe
