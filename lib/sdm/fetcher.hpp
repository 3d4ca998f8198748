#pragma once
#include <cstdint>
#include <string>

#include "http.hpp"
#include "iofile.hpp"
#include "planner.hpp"
#include "progress.hpp"

namespace sdm {
    // Streams one ranged GET into file at chunk.start, returns the number of bytes written.
    // Anything but a complete 206 body for exactly this range throws; bytes counted into
    // progress by a failed attempt are taken back before rethrowing.
    extern auto fetch_chunk(HTTP& http,
                            std::string const& url,
                            ChunkRange const& chunk,
                            std::int64_t total_size,
                            IO& file,
                            Progress* progress) -> std::int64_t;
}
