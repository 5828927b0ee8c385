// Audio decoding via single-header libraries:
//   - dr_wav, dr_flac, dr_mp3 (mackron/dr_libs)
//   - stb_vorbis (nothings/stb)
// dr_wav also writes the staged chunk files.

#define DR_WAV_IMPLEMENTATION
#define DR_FLAC_IMPLEMENTATION
#define DR_MP3_IMPLEMENTATION

#include "dr_flac.h"
#include "dr_mp3.h"
#include "dr_wav.h"

extern "C" {
#include "stb_vorbis.c"
}
#undef C
#undef R
#undef L

#include "chunkscribe/audio_io.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "chunkscribe/errors.hpp"

namespace chunkscribe {

// ─── Format Detection ────────────────────────────────────────────────────────

AudioFormat detect_format_by_extension(const std::string &path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext.empty())
        return AudioFormat::Unknown;
    ext.erase(0, 1);
    for (auto &c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (ext == "wav" || ext == "wave")
        return AudioFormat::WAV;
    if (ext == "flac")
        return AudioFormat::FLAC;
    if (ext == "mp3")
        return AudioFormat::MP3;
    if (ext == "ogg" || ext == "oga")
        return AudioFormat::OGG;
    return AudioFormat::Unknown;
}

AudioFormat detect_format_by_magic(const uint8_t *data, size_t len) {
    if (len < 2)
        return AudioFormat::Unknown;

    // MP3 frame sync
    if (data[0] == 0xFF && (data[1] & 0xE0) == 0xE0)
        return AudioFormat::MP3;
    if (len >= 3 && std::equal(data, data + 3, "ID3"))
        return AudioFormat::MP3;
    if (len < 4)
        return AudioFormat::Unknown;

    if (len >= 12 && std::equal(data, data + 4, "RIFF") &&
        std::equal(data + 8, data + 12, "WAVE"))
        return AudioFormat::WAV;
    if (std::equal(data, data + 4, "fLaC"))
        return AudioFormat::FLAC;
    if (std::equal(data, data + 4, "OggS"))
        return AudioFormat::OGG;
    return AudioFormat::Unknown;
}

namespace {

// ─── Windowed-Sinc Resampler ─────────────────────────────────────────────────

double bessel_i0(double x) {
    double sum = 1.0;
    double term = 1.0;
    for (int k = 1; k < 30; ++k) {
        term *= (x * x) / (4.0 * k * k);
        sum += term;
        if (term < 1e-12 * sum)
            break;
    }
    return sum;
}

// Kaiser window evaluated at offset t in [-half_width, half_width].
double kaiser(double t, double half_width, double beta) {
    double r = t / half_width;
    double v = 1.0 - r * r;
    return v <= 0.0 ? 0.0 : bessel_i0(beta * std::sqrt(v)) / bessel_i0(beta);
}

std::vector<float> sinc_resample(const float *in, size_t in_len, int src_rate,
                                 int dst_rate) {
    if (src_rate == dst_rate)
        return std::vector<float>(in, in + in_len);

    constexpr int HALF_TAPS = 16;
    constexpr double BETA = 7.857; // ~80dB stopband

    int g = std::gcd(src_rate, dst_rate);
    int64_t up = dst_rate / g;
    int64_t down = src_rate / g;
    size_t out_len = static_cast<size_t>(
        (static_cast<int64_t>(in_len) * up + down - 1) / down);

    double step = static_cast<double>(src_rate) / dst_rate; // input per output
    double cutoff = std::min(1.0, 1.0 / step);
    double stretch = std::max(1.0, step); // widen the kernel when decimating

    std::vector<float> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double pos = static_cast<double>(i) * step;
        int64_t center = static_cast<int64_t>(std::floor(pos));

        double acc = 0.0;
        double norm = 0.0;
        for (int64_t j = center - HALF_TAPS + 1; j <= center + HALF_TAPS;
             ++j) {
            if (j < 0 || j >= static_cast<int64_t>(in_len))
                continue;
            double dist = pos - static_cast<double>(j);
            double t = dist / stretch;
            if (std::abs(t) > HALF_TAPS)
                continue;

            double x = dist * cutoff * M_PI;
            double sinc = std::abs(x) < 1e-10 ? 1.0 : std::sin(x) / x;
            double w = sinc * kaiser(t, HALF_TAPS, BETA) * cutoff;
            acc += in[j] * w;
            norm += w;
        }
        out[i] = norm > 1e-10 ? static_cast<float>(acc / norm) : 0.0f;
    }
    return out;
}

// ─── Decoded PCM ─────────────────────────────────────────────────────────────

struct DecodedPcm {
    std::vector<float> interleaved;
    int channels = 0;
    int sample_rate = 0;
};

std::vector<float> downmix(const DecodedPcm &pcm) {
    if (pcm.channels == 1)
        return pcm.interleaved;
    size_t frames = pcm.interleaved.size() / pcm.channels;
    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < pcm.channels; ++c)
            sum += pcm.interleaved[i * pcm.channels + c];
        mono[i] = sum / static_cast<float>(pcm.channels);
    }
    return mono;
}

AudioData to_audio_data(std::vector<float> mono, int src_rate, int channels,
                        int target_rate, AudioFormat fmt) {
    double duration = static_cast<double>(mono.size()) / src_rate;
    if (src_rate != target_rate)
        mono = sinc_resample(mono.data(), mono.size(), src_rate, target_rate);

    auto n = static_cast<int64_t>(mono.size());
    auto tensor = axiom::Tensor::from_data(
        mono.data(), axiom::Shape{static_cast<size_t>(n)}, true);
    return AudioData{std::move(tensor), target_rate, src_rate, channels,
                     n,                 duration,    fmt};
}

DecodedPcm decode_wav(const std::string &path) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr))
        throw InputError("Cannot open WAV file: " + path);

    DecodedPcm pcm;
    pcm.channels = static_cast<int>(wav.channels);
    pcm.sample_rate = static_cast<int>(wav.sampleRate);
    pcm.interleaved.resize(wav.totalPCMFrameCount * wav.channels);
    drwav_uint64 frames = drwav_read_pcm_frames_f32(
        &wav, wav.totalPCMFrameCount, pcm.interleaved.data());
    drwav_uninit(&wav);

    pcm.interleaved.resize(frames * pcm.channels);
    return pcm;
}

DecodedPcm decode_flac(const std::string &path) {
    unsigned int channels = 0;
    unsigned int rate = 0;
    drflac_uint64 frames = 0;
    float *data = drflac_open_file_and_read_pcm_frames_f32(
        path.c_str(), &channels, &rate, &frames, nullptr);
    if (!data)
        throw InputError("Cannot open FLAC file: " + path);

    DecodedPcm pcm{std::vector<float>(data, data + frames * channels),
                   static_cast<int>(channels), static_cast<int>(rate)};
    drflac_free(data, nullptr);
    return pcm;
}

DecodedPcm decode_mp3(const std::string &path) {
    drmp3_config config;
    drmp3_uint64 frames = 0;
    float *data = drmp3_open_file_and_read_pcm_frames_f32(
        path.c_str(), &config, &frames, nullptr);
    if (!data)
        throw InputError("Cannot open MP3 file: " + path);

    DecodedPcm pcm{std::vector<float>(data, data + frames * config.channels),
                   static_cast<int>(config.channels),
                   static_cast<int>(config.sampleRate)};
    drmp3_free(data, nullptr);
    return pcm;
}

DecodedPcm decode_ogg(const std::string &path) {
    int channels = 0;
    int rate = 0;
    short *data = nullptr;
    int frames =
        stb_vorbis_decode_filename(path.c_str(), &channels, &rate, &data);
    if (frames < 0 || !data)
        throw InputError("Cannot open OGG file: " + path);

    DecodedPcm pcm;
    pcm.channels = channels;
    pcm.sample_rate = rate;
    size_t total = static_cast<size_t>(frames) * channels;
    pcm.interleaved.resize(total);
    for (size_t i = 0; i < total; ++i)
        pcm.interleaved[i] = static_cast<float>(data[i]) / 32768.0f;
    free(data);
    return pcm;
}

} // namespace

// ─── Loading ────────────────────────────────────────────────────────────────

AudioData read_audio(const std::string &path, int target_sample_rate) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw InputError("Input file not found: " + path);

    auto fmt = detect_format_by_extension(path);
    if (fmt == AudioFormat::Unknown) {
        std::ifstream file(path, std::ios::binary);
        if (!file)
            throw InputError("Cannot open audio file: " + path);
        uint8_t header[12];
        file.read(reinterpret_cast<char *>(header), sizeof(header));
        fmt = detect_format_by_magic(header,
                                     static_cast<size_t>(file.gcount()));
    }

    DecodedPcm pcm;
    switch (fmt) {
    case AudioFormat::WAV:
        pcm = decode_wav(path);
        break;
    case AudioFormat::FLAC:
        pcm = decode_flac(path);
        break;
    case AudioFormat::MP3:
        pcm = decode_mp3(path);
        break;
    case AudioFormat::OGG:
        pcm = decode_ogg(path);
        break;
    default:
        throw InputError("Unsupported or unrecognized audio format: " + path);
    }

    if (pcm.channels <= 0 || pcm.sample_rate <= 0)
        throw InputError("Audio file has no usable stream: " + path);

    return to_audio_data(downmix(pcm), pcm.sample_rate, pcm.channels,
                         target_sample_rate, fmt);
}

AudioData read_audio(const float *pcm, size_t num_samples, int sample_rate,
                     int target_sample_rate) {
    if (sample_rate <= 0)
        throw InputError("sample rate must be positive");
    return to_audio_data(std::vector<float>(pcm, pcm + num_samples),
                         sample_rate, 1, target_sample_rate,
                         AudioFormat::Unknown);
}

axiom::Tensor resample(const axiom::Tensor &samples, int src_rate,
                       int dst_rate) {
    if (src_rate == dst_rate)
        return samples;

    auto cont = samples.ascontiguousarray();
    auto out = sinc_resample(cont.typed_data<float>(), cont.shape()[0],
                             src_rate, dst_rate);
    return axiom::Tensor::from_data(out.data(), axiom::Shape{out.size()},
                                    true);
}

// ─── Chunk Extraction ───────────────────────────────────────────────────────

axiom::Tensor slice_samples(const axiom::Tensor &samples, int64_t start,
                            int64_t end) {
    auto cont = samples.ascontiguousarray();
    auto total = static_cast<int64_t>(cont.shape()[0]);
    if (start < 0 || end > total || end <= start) {
        throw InputError("sample range [" + std::to_string(start) + ", " +
                         std::to_string(end) + ") outside audio of " +
                         std::to_string(total) + " samples");
    }

    const float *data = cont.typed_data<float>();
    std::vector<float> slice(data + start, data + end);
    return axiom::Tensor::from_data(slice.data(), axiom::Shape{slice.size()},
                                    true);
}

void write_wav(const std::string &path, const axiom::Tensor &samples,
               int sample_rate) {
    auto cont = samples.ascontiguousarray();
    size_t n = cont.shape()[0];
    const float *data = cont.typed_data<float>();

    std::vector<int16_t> pcm(n);
    for (size_t i = 0; i < n; ++i) {
        float v = std::clamp(data[i], -1.0f, 1.0f);
        pcm[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
    }

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = 1;
    format.sampleRate = static_cast<drwav_uint32>(sample_rate);
    format.bitsPerSample = 16;

    drwav wav;
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr))
        throw std::runtime_error("Cannot create WAV file: " + path);
    drwav_uint64 written = drwav_write_pcm_frames(&wav, n, pcm.data());
    drwav_uninit(&wav);

    if (written != n)
        throw std::runtime_error("Short write to WAV file: " + path);
}

} // namespace chunkscribe
