#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace sdm {
    // Byte counter shared by every chunk task of one transfer.
    struct Progress {
        using update_cb = std::function<void(std::int64_t done, std::optional<std::int64_t> total)>;

        Progress(std::optional<std::int64_t> total, update_cb on_update = {}) noexcept;
        Progress(Progress const&) = delete;
        Progress& operator=(Progress const&) = delete;

        auto total() const noexcept -> std::optional<std::int64_t> { return total_; }

        auto done() const noexcept -> std::int64_t { return done_.load(std::memory_order_relaxed); }

        // May be called from any number of threads at once.
        auto add(std::int64_t count) -> void;

        // Takes back bytes of an attempt that did not complete.
        auto rollback(std::int64_t count) -> void;

    private:
        std::optional<std::int64_t> total_;
        std::atomic<std::int64_t> done_ = {};
        update_cb on_update_;
    };

    struct progress_bar {
        progress_bar(char const* banner, bool disabled, std::optional<std::int64_t> total);
        progress_bar(progress_bar const&) = delete;
        ~progress_bar() noexcept;

        auto update(std::int64_t done) -> void;

    private:
        auto render() const -> void;

        char const* banner_;
        bool disabled_ = {};
        std::optional<std::int64_t> total_;
        std::int64_t done_ = {};
        std::int64_t step_ = {};
        std::chrono::steady_clock::time_point start_;
    };

    extern auto format_bytes(double bytes) -> std::string;
}
