#pragma once

// Umbrella header: chunking, transcription and segment assembly

#include "chunkscribe/audio_io.hpp"
#include "chunkscribe/chunking.hpp"
#include "chunkscribe/config.hpp"
#include "chunkscribe/engine.hpp"
#include "chunkscribe/errors.hpp"
#include "chunkscribe/intervals.hpp"
#include "chunkscribe/pipeline.hpp"
#include "chunkscribe/segments.hpp"
#include "chunkscribe/staging.hpp"
#include "chunkscribe/timestamp.hpp"
#include "chunkscribe/transcript_json.hpp"
#include "chunkscribe/vad.hpp"
#include "chunkscribe/windowing.hpp"
