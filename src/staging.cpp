#include "chunkscribe/staging.hpp"

#include <system_error>

#include <unistd.h>

#include "chunkscribe/audio_io.hpp"

namespace chunkscribe {

std::string staged_file_name(size_t index) {
    return "_chunk_" + std::to_string(index + 1) + ".wav";
}

StagedChunk::StagedChunk(const std::filesystem::path &dir, size_t index,
                         const axiom::Tensor &samples, int sample_rate)
    : path_(dir / staged_file_name(index)) {
    try {
        write_wav(path_.string(), samples, sample_rate);
    } catch (const std::exception &) {
        std::error_code ec;
        std::filesystem::remove(path_, ec); // partial file, if any
        throw;
    }
}

StagedChunk::~StagedChunk() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

std::filesystem::path resolve_staging_dir(const std::string &configured) {
    std::filesystem::path dir =
        configured.empty()
            ? std::filesystem::temp_directory_path() /
                  ("chunkscribe-" + std::to_string(::getpid()))
            : std::filesystem::path(configured);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace chunkscribe
