#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "common.hpp"
#include "http.hpp"
#include "planner.hpp"
#include "probe.hpp"
#include "progress.hpp"
#include "retry.hpp"

namespace sdm {
    struct Transfer {
        enum class State {
            Idle,
            Probing,
            RangedPlanning,
            RangedExecuting,
            FallbackExecuting,
            Completed,
            Failed,
        };

        struct Options {
            std::uint32_t workers = {};
            RetryPolicy retry = {};
        };

        // on_progress, on_retry and on_chunk run on chunk threads, concurrently.
        struct Events {
            std::function<void(TransferSpec const& spec)> on_probe;
            std::function<void(ChunkPlan const& plan)> on_plan;
            Progress::update_cb on_progress;
            retry_cb on_retry;
            std::function<void(ChunkOutcome const& outcome)> on_chunk;
        };

        Transfer(HTTP::Factory factory, Options const& options, Events events = {});
        Transfer(Transfer const&) = delete;
        Transfer& operator=(Transfer const&) = delete;

        // Throws on any failure; the destination is left on disk as is.
        auto run(std::string const& url, fs::path const& path) -> void;

        auto state() const noexcept -> State { return state_; }

        auto spec() const noexcept -> TransferSpec const& { return spec_; }

        auto plan() const noexcept -> ChunkPlan const& { return plan_; }

        auto outcomes() const noexcept -> std::vector<ChunkOutcome> const& { return outcomes_; }

        auto bytes_written() const noexcept -> std::int64_t { return bytes_written_; }

    private:
        HTTP::Factory factory_;
        Options options_;
        Events events_;
        State state_ = State::Idle;
        TransferSpec spec_ = {};
        ChunkPlan plan_ = {};
        std::vector<ChunkOutcome> outcomes_ = {};
        std::int64_t bytes_written_ = {};

        auto run_ranged() -> void;
        auto run_fallback(HTTP& http) -> void;
    };

    extern auto to_string(Transfer::State state) noexcept -> char const*;
}
