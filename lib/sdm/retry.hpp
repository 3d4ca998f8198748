#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "common.hpp"

namespace sdm {
    struct RetryPolicy {
        std::uint32_t retries = 3;
        std::chrono::milliseconds backoff = std::chrono::seconds{2};
    };

    struct ChunkOutcome {
        std::uint32_t index = {};
        std::int64_t bytes_written = {};
        std::uint32_t attempts = {};
        std::optional<ErrorKind> error = {};
        std::string message = {};
    };

    using retry_cb = std::function<void(std::uint32_t index, std::uint32_t attempt, Error const& error)>;

    // Runs attempt up to policy.retries + 1 times with a fixed sleep in between.
    // Only sdm::Error is retried; the outcome keeps the last one when every attempt fails.
    extern auto with_retry(RetryPolicy const& policy,
                           std::uint32_t index,
                           function_ref<std::int64_t()> attempt,
                           retry_cb const& on_retry = {}) -> ChunkOutcome;
}
