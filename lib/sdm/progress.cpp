#include "progress.hpp"

#include <iostream>
#include <utility>

#include "common.hpp"

using namespace sdm;

Progress::Progress(std::optional<std::int64_t> total, update_cb on_update) noexcept
    : total_(total), on_update_(std::move(on_update)) {}

auto Progress::add(std::int64_t count) -> void {
    auto done = done_.fetch_add(count, std::memory_order_relaxed) + count;
    if (on_update_) {
        on_update_(done, total_);
    }
}

auto Progress::rollback(std::int64_t count) -> void {
    if (!count) {
        return;
    }
    auto done = done_.fetch_sub(count, std::memory_order_relaxed) - count;
    if (on_update_) {
        on_update_(done, total_);
    }
}

sdm::progress_bar::progress_bar(char const* banner, bool disabled, std::optional<std::int64_t> total)
    : banner_(banner), disabled_(disabled), total_(total), start_(std::chrono::steady_clock::now()) {
    if (!disabled_) {
        this->render();
    }
}

sdm::progress_bar::~progress_bar() noexcept {
    if (!disabled_) {
        this->render();
        std::cerr << std::endl;
    }
}

auto sdm::progress_bar::render() const -> void {
    auto const elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    auto const speed = elapsed > 0.0 ? (double)done_ / elapsed : 0.0;
    if (total_) {
        auto const total = std::max(*total_, std::int64_t{1});
        auto const percent = *total_ ? done_ * 100 / total : 100;
        std::cerr << fmt::format("\r{}: {}/{} {}% {}/s    ",
                                 banner_,
                                 format_bytes((double)done_),
                                 format_bytes((double)*total_),
                                 percent,
                                 format_bytes(speed));
    } else {
        std::cerr << fmt::format("\r{}: {} {}/s    ", banner_, format_bytes((double)done_), format_bytes(speed));
    }
}

auto sdm::progress_bar::update(std::int64_t done) -> void {
    done_ = done;
    auto step = done_ / MiB;
    if (total_ && *total_ > 0) {
        step = done_ * 100 / *total_;
    }
    if (std::exchange(step_, step) != step && !disabled_) {
        this->render();
    }
}

auto sdm::format_bytes(double bytes) -> std::string {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;
    if (bytes > GB) {
        return fmt::format("{:.2f} GB", bytes / GB);
    }
    if (bytes > MB) {
        return fmt::format("{:.2f} MB", bytes / MB);
    }
    if (bytes > KB) {
        return fmt::format("{:.2f} KB", bytes / KB);
    }
    return fmt::format("{:.2f} B", bytes);
}
