#include "retry.hpp"

#include <thread>

using namespace sdm;

auto sdm::with_retry(RetryPolicy const& policy,
                     std::uint32_t index,
                     function_ref<std::int64_t()> attempt,
                     retry_cb const& on_retry) -> ChunkOutcome {
    auto outcome = ChunkOutcome{.index = index};
    for (;;) {
        ++outcome.attempts;
        try {
            outcome.bytes_written = attempt();
            outcome.error = std::nullopt;
            outcome.message.clear();
            error_stack().clear();
            return outcome;
        } catch (Error const& error) {
            outcome.error = error.kind();
            outcome.message = error.what();
            for (auto const& trace : error_stack()) {
                outcome.message += "\n  ";
                outcome.message += trace;
            }
            error_stack().clear();
            if (outcome.attempts > policy.retries) {
                return outcome;
            }
            if (on_retry) {
                on_retry(index, outcome.attempts, error);
            }
        }
        std::this_thread::sleep_for(policy.backoff);
    }
}
