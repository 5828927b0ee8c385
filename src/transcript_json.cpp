#include "chunkscribe/transcript_json.hpp"

#include <fstream>
#include <stdexcept>

namespace chunkscribe {

nlohmann::json to_json(const Transcript &transcript) {
    auto segments = nlohmann::json::array();
    for (const auto &seg : transcript.segments) {
        auto words = nlohmann::json::array();
        for (const auto &w : seg.words) {
            words.push_back({{"word", w.word},
                             {"start", w.start},
                             {"end", w.end},
                             {"score", w.score}});
        }
        segments.push_back({{"start", seg.start},
                            {"end", seg.end},
                            {"text", seg.text},
                            {"words", std::move(words)}});
    }

    nlohmann::json doc;
    doc["segments"] = std::move(segments);
    doc["language"] = transcript.language;
    return doc;
}

std::filesystem::path output_path_for(const std::filesystem::path &input,
                                      const std::filesystem::path &output_dir) {
    return output_dir / (input.stem().string() + ".json");
}

std::filesystem::path write_transcript(const Transcript &transcript,
                                       const std::filesystem::path &input,
                                       const std::filesystem::path &output_dir) {
    std::filesystem::create_directories(output_dir);
    auto path = output_path_for(input, output_dir);

    std::ofstream out(path, std::ios::binary);
    if (!out)
        throw std::runtime_error("Cannot write transcript: " + path.string());
    out << to_json(transcript).dump(2) << '\n';
    if (!out)
        throw std::runtime_error("Short write to transcript: " + path.string());
    return path;
}

} // namespace chunkscribe
