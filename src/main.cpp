#include "chunkscribe/chunkscribe.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <audio> --output-dir DIR [options]\n"
        << "\nEngine:\n"
        << "  --engine-cmd CMD     Recognizer command, run once per chunk\n"
        << "                       ({audio} {model} {language} substituted;\n"
        << "                       default: $CHUNKSCRIBE_ENGINE_CMD)\n"
        << "  --model ID           Model identifier "
           "(default: nvidia/parakeet-tdt-0.6b-v3)\n"
        << "  --language TAG       Language tag (default: en)\n"
        << "\nChunking:\n"
        << "  --mode vad|window    Chunking strategy (default: vad)\n"
        << "  --merge-gap S        Merge speech separated by < S seconds (10)\n"
        << "  --max-chunk S        Soft chunk length bound (300)\n"
        << "  --split-gap S        Smallest pause a long chunk splits at (1)\n"
        << "  --chunk-duration S   Window length in window mode (300)\n"
        << "  --overlap S          Window overlap in window mode (5)\n"
        << "  --vad-threshold X    Minimum RMS speech threshold (0.02)\n"
        << "  --min-speech-ms N    Drop speech shorter than N ms (250)\n"
        << "  --min-silence-ms N   Bridge silence shorter than N ms (100)\n"
        << "\nSegments:\n"
        << "  --gap-threshold S    Pause that starts a new segment (0.4)\n"
        << "  --max-duration S     Segment length cap (10)\n"
        << "  --break-policy P     timing | word-boundary (default: timing)\n"
        << "\nRun:\n"
        << "  --staging-dir DIR    Where chunk WAVs are staged "
           "(default: temp dir)\n"
        << "  --on-chunk-error P   abort | skip (default: abort)\n"
        << "  --quiet              No per-chunk progress\n"
        << std::endl;
}

static double parse_seconds(const std::string &flag, const std::string &value) {
    size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(value, &used);
    } catch (const std::exception &) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw chunkscribe::ConfigError(flag + " expects a number, got '" +
                                       value + "'");
    }
    return out;
}

static int parse_int(const std::string &flag, const std::string &value) {
    size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(value, &used);
    } catch (const std::exception &) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw chunkscribe::ConfigError(flag + " expects an integer, got '" +
                                       value + "'");
    }
    return out;
}

int main(int argc, char *argv[]) {
    using namespace chunkscribe;
    using Clock = std::chrono::high_resolution_clock;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string audio_path = argv[1];
    if (audio_path == "-h" || audio_path == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    // Input must exist before flags are even looked at
    if (!std::filesystem::exists(audio_path)) {
        std::cerr << "Error: Input file not found: " << audio_path
                  << std::endl;
        return 1;
    }

    try {

        // 1. Parse arguments
        PipelineConfig cfg = make_default_config();
        std::string output_dir;
        bool quiet = false;
        if (const char *env = std::getenv("CHUNKSCRIBE_ENGINE_CMD")) {
            cfg.engine.command = env;
        }

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--quiet") {
                quiet = true;
            } else if (arg == "--output-dir" && has_value) {
                output_dir = argv[++i];
            } else if (arg == "--engine-cmd" && has_value) {
                cfg.engine.command = argv[++i];
            } else if (arg == "--model" && has_value) {
                cfg.engine.model = argv[++i];
            } else if (arg == "--language" && has_value) {
                cfg.language = argv[++i];
            } else if (arg == "--mode" && has_value) {
                cfg.mode = parse_chunking_mode(argv[++i]);
            } else if (arg == "--merge-gap" && has_value) {
                cfg.consolidator.merge_gap = parse_seconds(arg, argv[++i]);
            } else if (arg == "--max-chunk" && has_value) {
                cfg.consolidator.max_chunk = parse_seconds(arg, argv[++i]);
            } else if (arg == "--split-gap" && has_value) {
                cfg.consolidator.split_gap = parse_seconds(arg, argv[++i]);
            } else if (arg == "--chunk-duration" && has_value) {
                cfg.window.chunk_duration = parse_seconds(arg, argv[++i]);
            } else if (arg == "--overlap" && has_value) {
                cfg.window.overlap = parse_seconds(arg, argv[++i]);
            } else if (arg == "--gap-threshold" && has_value) {
                cfg.segmenter.gap_threshold = parse_seconds(arg, argv[++i]);
            } else if (arg == "--max-duration" && has_value) {
                cfg.segmenter.max_duration = parse_seconds(arg, argv[++i]);
            } else if (arg == "--break-policy" && has_value) {
                cfg.segmenter.break_policy = parse_break_policy(argv[++i]);
            } else if (arg == "--vad-threshold" && has_value) {
                cfg.vad.threshold =
                    static_cast<float>(parse_seconds(arg, argv[++i]));
            } else if (arg == "--min-speech-ms" && has_value) {
                cfg.vad.min_speech_duration_ms = parse_int(arg, argv[++i]);
            } else if (arg == "--min-silence-ms" && has_value) {
                cfg.vad.min_silence_duration_ms = parse_int(arg, argv[++i]);
            } else if (arg == "--staging-dir" && has_value) {
                cfg.staging_dir = argv[++i];
            } else if (arg == "--on-chunk-error" && has_value) {
                cfg.on_chunk_error = parse_chunk_error_policy(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 2;
            }
        }

        if (output_dir.empty()) {
            throw ConfigError("--output-dir is required");
        }
        validate(cfg);

        // 2. Components
        EnergyVad vad(cfg.vad);
        auto chunker = make_chunking_strategy(cfg, vad);
        CommandEngine engine(cfg.engine, cfg.language);
        Pipeline pipeline(cfg, *chunker, engine);

        if (!quiet) {
            pipeline.on_progress([](const ChunkProgress &p) {
                std::cerr << std::fixed << std::setprecision(1)
                          << "Processing chunk " << p.index + 1 << "/"
                          << p.count << ": " << p.start << "s - " << p.end
                          << "s (" << p.end - p.start << "s) -> ";
                if (p.failed)
                    std::cerr << "failed" << std::endl;
                else
                    std::cerr << p.words << " words" << std::endl;
            });
        }

        // 3. Read audio
        auto t0 = Clock::now();
        auto audio = read_audio(audio_path, cfg.sample_rate);
        if (!quiet) {
            std::cerr << "Audio: " << audio_path << " (" << std::fixed
                      << std::setprecision(1) << audio.duration << "s, "
                      << audio.original_sample_rate << " Hz, "
                      << audio.num_channels << " ch)" << std::endl;
            std::cerr << "Chunking: " << chunker->name()
                      << ", engine: " << engine.name() << std::endl;
        }

        // 4. Run
        auto result = pipeline.run(audio);
        auto path = write_transcript(result.transcript, audio_path, output_dir);
        auto t1 = Clock::now();

        double elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0)
                .count() /
            1000.0;
        std::cout << "Transcript: " << path.string() << std::endl;
        std::cout << "  Chunks: " << result.stats.chunks;
        if (result.stats.failed_chunks > 0)
            std::cout << " (" << result.stats.failed_chunks << " failed)";
        std::cout << ", words: " << result.stats.words
                  << ", segments: " << result.transcript.segments.size()
                  << std::endl;
        std::cout << std::fixed << std::setprecision(1)
                  << "  Audio: " << result.stats.audio_seconds
                  << "s, processed in " << elapsed << "s" << std::endl;

    } catch (const ConfigError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const InputError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
