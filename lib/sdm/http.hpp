#pragma once
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "common.hpp"

namespace sdm {
    // Parsed "Content-Range: bytes <start>-<end>/<total>" header.
    // Unknown parts ("*") are left as nullopt.
    struct ContentRange {
        std::optional<std::int64_t> start = {};
        std::optional<std::int64_t> end = {};
        std::optional<std::int64_t> total = {};

        static auto parse(std::string_view value) noexcept -> std::optional<ContentRange>;
    };

    struct HTTP {
        struct Options {
            bool verbose = {};
            long buffer = 512 * KiB;
            std::string proxy = {};
            std::string useragent = "sdm/1.0";
            long connect_timeout = 30;
            long low_speed_limit = 1024;
            long low_speed_time = 60;
            long max_redirects = 10;
            bool insecure = {};
        };

        struct Response {
            long status = {};
            std::map<std::string, std::string, less_ci> headers = {};

            auto header(std::string_view name) const -> std::optional<std::string_view>;
        };

        // Called once the final status line and headers are known.
        // Returning false stops the body without raising an error.
        using headers_cb = function_ref<bool(Response const& response)>;
        using data_cb = function_ref<void(std::span<char const> data)>;

        using Factory = std::function<std::unique_ptr<HTTP>()>;

        struct Curl;

        virtual ~HTTP() noexcept = default;

        // Performs a GET; range uses the "<start>-<end>" form, empty for the whole resource.
        // Callbacks may throw, the exception is propagated out of get().
        virtual auto get(std::string const& url, std::string const& range, headers_cb on_headers, data_cb on_data)
            -> Response = 0;
    };

    struct HTTP::Curl final : HTTP {
        Curl(Options const& options);
        Curl(Curl const&) = delete;
        Curl& operator=(Curl const&) = delete;
        ~Curl() noexcept;

        auto get(std::string const& url, std::string const& range, headers_cb on_headers, data_cb on_data)
            -> Response override;

    private:
        void* handle_ = {};
        Response response_ = {};
        headers_cb on_headers_ = {};
        data_cb on_data_ = {};
        bool headers_done_ = {};
        bool stopped_ = {};
        std::exception_ptr error_ = {};

        auto finish_headers() -> bool;

        static auto recv_header(char const* data, size_t size, size_t ncount, Curl* self) noexcept -> size_t;
        static auto recv_data(char const* data, size_t size, size_t ncount, Curl* self) noexcept -> size_t;
    };
}
