#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkscribe/pipeline.hpp"

namespace chunkscribe {

// ─── Transcript Output ──────────────────────────────────────────────────────

// {"segments": [{"start", "end", "text",
//                "words": [{"word", "start", "end", "score"}]}],
//  "language": "en"}
nlohmann::json to_json(const Transcript &transcript);

// <output_dir>/<input stem>.json
std::filesystem::path output_path_for(const std::filesystem::path &input,
                                      const std::filesystem::path &output_dir);

// Serialize with 2-space indent and raw UTF-8, creating output_dir if needed.
// Returns the written path.
std::filesystem::path write_transcript(const Transcript &transcript,
                                       const std::filesystem::path &input,
                                       const std::filesystem::path &output_dir);

} // namespace chunkscribe
