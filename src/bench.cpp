#include "chunkscribe/chunkscribe.hpp"

#include <benchmark/benchmark.h>

#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static bool flag_markdown = false;
static bool flag_no_vad = false;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--markdown")
            flag_markdown = true;
        else if (arg == "--no-vad")
            flag_no_vad = true;
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Split "consolidate/10000" → ("consolidate", "10000")
static std::pair<std::string, std::string>
parse_name_arg(const std::string &name) {
    auto slash = name.find('/');
    if (slash == std::string::npos)
        return {name, ""};
    auto next = name.find('/', slash + 1);
    return {name.substr(0, slash),
            name.substr(slash + 1, next == std::string::npos
                                       ? std::string::npos
                                       : next - slash - 1)};
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Stage | Input | Time (ms) | Items/s |\n";
        std::cout << "|-------|-------|-----------|---------|\n";

        for (const auto &r : runs_) {
            if (r.skipped != benchmark::internal::NotSkipped)
                continue;

            auto [stage, input] = parse_name_arg(r.benchmark_name());
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            double items = 0.0;
            auto it = r.counters.find("items_per_second");
            if (it != r.counters.end())
                items = it->second.value;

            std::cout << "| " << stage << " | " << input << " | "
                      << std::fixed << std::setprecision(3) << time_ms
                      << " | " << std::setprecision(0) << items << " |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Synthetic inputs ───────────────────────────────────────────────────────

// Speech bursts of 0.3-8 s separated by 0.05-3 s pauses, fixed seed.
static std::vector<chunkscribe::SpeechInterval>
make_intervals(int64_t count, int sample_rate) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> speech(0.3, 8.0);
    std::uniform_real_distribution<double> pause(0.05, 3.0);

    std::vector<chunkscribe::SpeechInterval> out;
    out.reserve(static_cast<size_t>(count));
    int64_t t = 0;
    for (int64_t i = 0; i < count; ++i) {
        int64_t start = t + chunkscribe::seconds_to_samples(pause(rng),
                                                            sample_rate);
        int64_t end = start + chunkscribe::seconds_to_samples(speech(rng),
                                                              sample_rate);
        out.push_back({start, end});
        t = end;
    }
    return out;
}

// Word tokens of 0.1-0.6 s with occasional long pauses.
static std::vector<chunkscribe::WordToken> make_words(int64_t count) {
    std::mt19937 rng(5678);
    std::uniform_real_distribution<double> length(0.1, 0.6);
    std::uniform_real_distribution<double> pause(0.0, 0.2);
    std::bernoulli_distribution long_pause(0.05);

    std::vector<chunkscribe::WordToken> out;
    out.reserve(static_cast<size_t>(count));
    double t = 0.0;
    for (int64_t i = 0; i < count; ++i) {
        double start = t + pause(rng) + (long_pause(rng) ? 1.0 : 0.0);
        double end = start + length(rng);
        out.push_back({"\xe2\x96\x81word" + std::to_string(i), start, end,
                       0.9});
        t = end;
    }
    return out;
}

// Tone bursts with silent gaps, 16 kHz mono.
static axiom::Tensor make_speechlike(int seconds) {
    const int sr = chunkscribe::DEFAULT_SAMPLE_RATE;
    std::vector<float> pcm(static_cast<size_t>(seconds) * sr);
    for (size_t i = 0; i < pcm.size(); ++i) {
        bool voiced = (i / (sr / 2)) % 3 != 2; // 1 s on, 0.5 s off
        pcm[i] = voiced ? 0.3f * std::sin(2.0f * 3.14159265f * 220.0f *
                                          static_cast<float>(i) / sr)
                        : 0.0f;
    }
    return axiom::Tensor::from_data(pcm.data(),
                                    axiom::Shape{pcm.size()}, true);
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static void BM_Consolidate(benchmark::State &state) {
    const int sr = chunkscribe::DEFAULT_SAMPLE_RATE;
    auto intervals = make_intervals(state.range(0), sr);
    chunkscribe::ConsolidatorConfig cfg;
    cfg.merge_gap = 1.0;
    cfg.max_chunk = 30.0;
    cfg.split_gap = 0.5;

    for (auto _ : state) {
        auto chunks = chunkscribe::consolidate_intervals(intervals, sr, cfg);
        benchmark::DoNotOptimize(chunks.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_BuildSegments(benchmark::State &state) {
    auto words = make_words(state.range(0));
    chunkscribe::SegmenterConfig timing;
    chunkscribe::SegmenterConfig boundary;
    boundary.break_policy = chunkscribe::BreakPolicy::WordBoundary;
    const auto &cfg = state.range(1) ? boundary : timing;

    for (auto _ : state) {
        auto segments = chunkscribe::build_segments(words, cfg);
        benchmark::DoNotOptimize(segments.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_EnergyVad(benchmark::State &state) {
    auto samples = make_speechlike(static_cast<int>(state.range(0)));
    chunkscribe::EnergyVad vad;

    for (auto _ : state) {
        auto regions = vad.detect(samples, chunkscribe::DEFAULT_SAMPLE_RATE);
        benchmark::DoNotOptimize(regions.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.counters["Throughput"] =
        benchmark::Counter(static_cast<double>(state.range(0)),
                           benchmark::Counter::kIsIterationInvariantRate);
}

static void register_benchmarks() {
    benchmark::RegisterBenchmark("consolidate", BM_Consolidate)
        ->RangeMultiplier(10)
        ->Range(100, 100000)
        ->UseRealTime()
        ->Unit(benchmark::kMillisecond);

    benchmark::RegisterBenchmark("segments", BM_BuildSegments)
        ->ArgsProduct({{1000, 10000, 100000}, {0, 1}})
        ->UseRealTime()
        ->Unit(benchmark::kMillisecond);

    // audio seconds
    if (!flag_no_vad) {
        benchmark::RegisterBenchmark("energy_vad", BM_EnergyVad)
            ->Arg(10)
            ->Arg(60)
            ->Arg(600)
            ->UseRealTime()
            ->Unit(benchmark::kMillisecond);
    }
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        std::cerr << "Usage: chunkscribe-bench [--markdown] [--no-vad] "
                     "[benchmark flags]"
                  << std::endl;
        return 1;
    }
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
