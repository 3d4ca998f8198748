#pragma once
#include <fmt/format.h>

#include <algorithm>
#include <cinttypes>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#ifdef _MSC_VER
#    define __PRETTY_FUNCTION__ __FUNCTION__
#endif

#define sdm_paste_impl(x, y) x##y
#define sdm_paste(x, y) sdm_paste_impl(x, y)

#define sdm_error(kind, msg) ::sdm::throw_error(::sdm::ErrorKind::kind, __PRETTY_FUNCTION__, msg)

#define sdm_assert(kind, ...)                                                                \
    do {                                                                                     \
        if (!(__VA_ARGS__)) [[unlikely]] {                                                   \
            ::sdm::throw_error(::sdm::ErrorKind::kind, __PRETTY_FUNCTION__, #__VA_ARGS__);   \
        }                                                                                    \
    } while (false)

#define sdm_trace(...)                               \
    ::sdm::ErrorTrace sdm_paste(_trace_, __LINE__) { \
        [&] { ::sdm::push_error_msg(__VA_ARGS__); }  \
    }

#define sdm_assert_easy_curl(...)                                                                    \
    do {                                                                                             \
        if (auto result = __VA_ARGS__; result != CURLE_OK) [[unlikely]] {                            \
            ::sdm::throw_error(::sdm::ErrorKind::Transport, __PRETTY_FUNCTION__, curl_easy_strerror(result)); \
        }                                                                                            \
    } while (false)

namespace sdm {
    static constexpr std::int64_t KiB = 1024;
    static constexpr std::int64_t MiB = KiB * 1024;
    static constexpr std::int64_t GiB = MiB * 1024;

    namespace fs = std::filesystem;
    using namespace std::literals::string_view_literals;

    enum class ErrorKind {
        Transport,
        Protocol,
        IO,
        ExhaustedRetries,
    };

    extern auto to_string(ErrorKind kind) noexcept -> char const*;

    struct Error : std::runtime_error {
        Error(ErrorKind kind, std::string const& msg) : std::runtime_error(msg), kind_(kind) {}

        auto kind() const noexcept -> ErrorKind { return kind_; }

    private:
        ErrorKind kind_;
    };

    [[noreturn]] extern void throw_error(ErrorKind kind, std::string_view from, char const* msg);

    [[noreturn]] inline void throw_error(ErrorKind kind, std::string_view from, std::string const& msg) {
        throw_error(kind, from, msg.c_str());
    }

    [[noreturn]] inline void throw_error(ErrorKind kind, std::string_view from, std::error_code const& ec) {
        throw_error(kind, from, ec.message().c_str());
    }

    using error_stack_t = std::vector<std::string>;

    extern error_stack_t& error_stack() noexcept;

    extern void push_error_msg(char const* fmt, ...) noexcept;

    template <typename Func>
    struct ErrorTrace : Func {
        inline ErrorTrace(Func&& func) noexcept : Func(std::move(func)) {}
        inline ~ErrorTrace() noexcept {
            if (std::uncaught_exceptions()) {
                Func::operator()();
            }
        }
    };

    extern auto from_dec(std::string_view str) noexcept -> std::optional<std::int64_t>;

    inline auto str_split(std::string_view str, char c) noexcept -> std::pair<std::string_view, std::string_view> {
        if (auto n = str.find(c); n != std::string_view::npos) {
            return {str.substr(0, n), str.substr(n + 1)};
        }
        return {str, {}};
    }

    inline auto str_strip(std::string_view str) noexcept -> std::string_view {
        while (!str.empty() && ::isspace((unsigned char)str.front())) str.remove_prefix(1);
        while (!str.empty() && ::isspace((unsigned char)str.back())) str.remove_suffix(1);
        return str;
    }

    constexpr auto str_lt_ci = [](std::string_view l, std::string_view r) noexcept -> bool {
        constexpr auto lower = [](std::uint8_t c) noexcept -> std::uint8_t {
            return (c >= 'A' && c <= 'Z') ? ((c - 'A') + 'a') : c;
        };
        return std::lexicographical_compare(l.begin(), l.end(), r.begin(), r.end(), [&](auto l, auto r) {
            return lower(l) < lower(r);
        });
    };

    struct less_ci {
        using is_transparent = void;

        auto operator()(std::string_view l, std::string_view r) const noexcept -> bool { return str_lt_ci(l, r); }
    };

    constexpr auto str_eq_ci = [](std::string_view l, std::string_view r) noexcept -> bool {
        constexpr auto lower = [](std::uint8_t c) noexcept -> std::uint8_t {
            return (c >= 'A' && c <= 'Z') ? ((c - 'A') + 'a') : c;
        };
        return l.size() == r.size() && std::equal(l.begin(), l.end(), r.begin(), r.end(), [&](auto l, auto r) {
                   return lower(l) == lower(r);
               });
    };

    template <typename Signature>
    struct function_ref;

    template <typename Ret, typename... Args>
    struct function_ref<Ret(Args...)> {
        constexpr function_ref() noexcept = default;

        template <typename Func>
            requires(std::is_invocable_r_v<Ret, Func, Args...>)
        function_ref(Func* func)
        noexcept
            : ref_((void*)func),
              invoke_(+[](void* ref, Args... args) -> Ret { return std::invoke(*(Func*)ref, args...); }) {}

        template <typename Func>
            requires(std::is_invocable_r_v<Ret, Func, Args...> && !std::is_same_v<std::decay_t<Func>, function_ref>)
        function_ref(Func&& func)
        noexcept : function_ref(&func) {}

        explicit constexpr operator bool() const noexcept { return ref_; }

        constexpr bool operator!() const noexcept { return !ref_; }

        auto operator()(Args... args) const -> Ret { return invoke_(ref_, args...); }

    private:
        void* ref_ = nullptr;
        Ret (*invoke_)(void* ref, Args...) = nullptr;
    };
}
