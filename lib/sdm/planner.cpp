#include "planner.hpp"

using namespace sdm;

auto sdm::plan_workers(std::int64_t total_size) noexcept -> std::uint32_t {
    if (total_size < 5 * MiB) {
        return 1;
    }
    if (total_size < 100 * MiB) {
        return 4;
    }
    if (total_size < 1 * GiB) {
        return 8;
    }
    return 16;
}

auto sdm::plan_chunks(std::int64_t total_size, std::uint32_t workers) -> ChunkPlan {
    sdm_assert(Protocol, total_size >= 0);
    if (total_size == 0) {
        return {ChunkRange{.index = 0, .start = 0, .end = -1}};
    }
    if (!workers) {
        workers = plan_workers(total_size);
    }
    auto const count = (std::int64_t)std::min((std::int64_t)workers, total_size);
    auto const base = total_size / count;
    auto plan = ChunkPlan{};
    plan.reserve((std::size_t)count);
    for (std::int64_t i = 0; i != count; ++i) {
        auto const start = i * base;
        auto const end = i == count - 1 ? total_size - 1 : start + base - 1;
        plan.push_back({.index = (std::uint32_t)i, .start = start, .end = end});
    }
    return plan;
}
