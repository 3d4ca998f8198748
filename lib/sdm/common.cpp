#include "common.hpp"

#include <charconv>
#include <cstdarg>
#include <cstdio>

using namespace sdm;

auto sdm::to_string(ErrorKind kind) noexcept -> char const* {
    switch (kind) {
        case ErrorKind::Transport:
            return "TransportError";
        case ErrorKind::Protocol:
            return "ProtocolMismatchError";
        case ErrorKind::IO:
            return "IOError";
        case ErrorKind::ExhaustedRetries:
            return "ExhaustedRetriesError";
    }
    return "Error";
}

void sdm::throw_error(ErrorKind kind, std::string_view from, char const* msg) {
    // break point goes here
    throw Error(kind, fmt::format("{}: {}: {}", to_string(kind), from, msg));
}

error_stack_t& sdm::error_stack() noexcept {
    thread_local error_stack_t instance = {};
    return instance;
}

void sdm::push_error_msg(char const* fmt, ...) noexcept {
    va_list args;
    char buffer[4096];
    int result;
    va_start(args, fmt);
    result = vsnprintf(buffer, 4096, fmt, args);
    va_end(args);
    if (result >= 0) {
        error_stack().push_back({buffer, buffer + std::min(result, 4095)});
    }
}

auto sdm::from_dec(std::string_view str) noexcept -> std::optional<std::int64_t> {
    auto result = std::int64_t{};
    if (str.empty()) {
        return std::nullopt;
    }
    auto [p, ec] = std::from_chars(str.data(), str.data() + str.size(), result, 10);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    if (p != str.data() + str.size()) {
        return std::nullopt;
    }
    return result;
}
