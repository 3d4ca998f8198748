#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "common.hpp"

namespace sdm {
    struct ChunkRange {
        std::uint32_t index = {};
        std::int64_t start = {};
        std::int64_t end = {};  // inclusive, start - 1 when empty

        auto size() const noexcept -> std::int64_t { return end - start + 1; }

        // Value for CURLOPT_RANGE, "<start>-<end>".
        auto range() const -> std::string { return fmt::format("{}-{}", start, end); }
    };

    using ChunkPlan = std::vector<ChunkRange>;

    // 1 worker below 5 MiB, 4 below 100 MiB, 8 below 1 GiB, 16 above.
    extern auto plan_workers(std::int64_t total_size) noexcept -> std::uint32_t;

    // Splits [0, total_size - 1] into contiguous chunks, the last one takes the remainder.
    // A zero worker count picks one with plan_workers, the count never exceeds total_size.
    extern auto plan_chunks(std::int64_t total_size, std::uint32_t workers) -> ChunkPlan;
}
