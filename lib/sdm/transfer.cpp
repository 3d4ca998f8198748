#include "transfer.hpp"

#include <future>

#include "fallback.hpp"
#include "fetcher.hpp"
#include "iofile.hpp"

using namespace sdm;

auto sdm::to_string(Transfer::State state) noexcept -> char const* {
    switch (state) {
        case Transfer::State::Idle:
            return "Idle";
        case Transfer::State::Probing:
            return "Probing";
        case Transfer::State::RangedPlanning:
            return "RangedPlanning";
        case Transfer::State::RangedExecuting:
            return "RangedExecuting";
        case Transfer::State::FallbackExecuting:
            return "FallbackExecuting";
        case Transfer::State::Completed:
            return "Completed";
        case Transfer::State::Failed:
            return "Failed";
    }
    return "Unknown";
}

Transfer::Transfer(HTTP::Factory factory, Options const& options, Events events)
    : factory_(std::move(factory)), options_(options), events_(std::move(events)) {}

auto Transfer::run(std::string const& url, fs::path const& path) -> void {
    spec_ = {};
    plan_.clear();
    outcomes_.clear();
    bytes_written_ = 0;
    try {
        state_ = State::Probing;
        auto http = factory_();
        spec_ = probe(*http, url, path);
        if (events_.on_probe) {
            events_.on_probe(spec_);
        }
        if (spec_.supports_ranges) {
            http.reset();
            run_ranged();
        } else {
            run_fallback(*http);
        }
        state_ = State::Completed;
    } catch (...) {
        state_ = State::Failed;
        throw;
    }
}

auto Transfer::run_ranged() -> void {
    state_ = State::RangedPlanning;
    sdm_assert(Protocol, spec_.total_size.has_value());
    auto const total_size = *spec_.total_size;
    plan_ = plan_chunks(total_size, options_.workers);
    if (events_.on_plan) {
        events_.on_plan(plan_);
    }

    auto file = IO::File(spec_.path, IO::WRITE | IO::TRUNCATE | IO::RANDOM_ACCESS);
    if (!file.resize(0, (std::uint64_t)total_size)) {
        sdm_error(IO, fmt::format("failed to pre-size {} to {} bytes", spec_.path.string(), total_size));
    }

    state_ = State::RangedExecuting;
    auto progress = Progress(total_size, events_.on_progress);
    auto tasks = std::vector<std::future<ChunkOutcome>>{};
    tasks.reserve(plan_.size());
    for (auto const& chunk : plan_) {
        tasks.push_back(std::async(std::launch::async, [this, &file, &progress, chunk, total_size] {
            auto http = std::unique_ptr<HTTP>{};
            auto outcome = with_retry(
                options_.retry,
                chunk.index,
                [&]() -> std::int64_t {
                    if (!http) {
                        http = factory_();
                    }
                    return fetch_chunk(*http, spec_.url, chunk, total_size, file, &progress);
                },
                events_.on_retry);
            if (events_.on_chunk) {
                events_.on_chunk(outcome);
            }
            return outcome;
        }));
    }

    for (auto& task : tasks) {
        outcomes_.push_back(task.get());
    }

    auto failed = std::size_t{};
    auto report = std::string{};
    for (auto const& outcome : outcomes_) {
        bytes_written_ += outcome.bytes_written;
        if (outcome.error) {
            auto const& chunk = plan_[outcome.index];
            report += fmt::format("\n  chunk #{} [{}] after {} attempts: {}",
                                  chunk.index,
                                  chunk.range(),
                                  outcome.attempts,
                                  outcome.message);
            ++failed;
        }
    }
    if (failed) {
        sdm_error(ExhaustedRetries, fmt::format("{} of {} chunks failed:{}", failed, outcomes_.size(), report));
    }
}

auto Transfer::run_fallback(HTTP& http) -> void {
    state_ = State::FallbackExecuting;
    auto progress = Progress(spec_.total_size, events_.on_progress);
    bytes_written_ = fetch_whole(http, spec_.url, spec_.path, spec_.total_size, &progress);
}
