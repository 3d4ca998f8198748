#include "http.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <cstring>
#include <utility>

using namespace sdm;

struct CurlInit {
    CurlInit() noexcept { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlInit() noexcept { curl_global_cleanup(); }
};

auto ContentRange::parse(std::string_view value) noexcept -> std::optional<ContentRange> {
    auto [unit, rest] = str_split(str_strip(value), ' ');
    if (!str_eq_ci(unit, "bytes"sv)) {
        return std::nullopt;
    }
    auto [range, total] = str_split(str_strip(rest), '/');
    auto result = ContentRange{};
    range = str_strip(range);
    total = str_strip(total);
    if (total.empty()) {
        return std::nullopt;
    }
    if (total != "*"sv) {
        result.total = from_dec(total);
        if (!result.total || *result.total < 0) {
            return std::nullopt;
        }
    }
    if (range != "*"sv) {
        auto [start, end] = str_split(range, '-');
        result.start = from_dec(str_strip(start));
        result.end = from_dec(str_strip(end));
        if (!result.start || !result.end || *result.start < 0 || *result.end < *result.start) {
            return std::nullopt;
        }
        if (result.total && *result.end >= *result.total) {
            return std::nullopt;
        }
    }
    return result;
}

auto HTTP::Response::header(std::string_view name) const -> std::optional<std::string_view> {
    if (auto i = headers.find(name); i != headers.end()) {
        return std::string_view{i->second};
    }
    return std::nullopt;
}

HTTP::Curl::Curl(Options const& options) : handle_(nullptr) {
    static auto init = CurlInit{};
    handle_ = curl_easy_init();
    sdm_assert(Transport, handle_);
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_VERBOSE, (options.verbose ? 1L : 0L)));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_MAXREDIRS, options.max_redirects));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_HEADERFUNCTION, &recv_header));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_HEADERDATA, this));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &recv_data));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_WRITEDATA, this));
    if (options.buffer) {
        sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_BUFFERSIZE, options.buffer));
    }
    if (options.connect_timeout) {
        sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, options.connect_timeout));
    }
    if (options.low_speed_time) {
        sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_LIMIT, options.low_speed_limit));
        sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_TIME, options.low_speed_time));
    }
    if (!options.proxy.empty()) {
        sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_PROXY, options.proxy.c_str()));
    }
    if (!options.useragent.empty()) {
        sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_USERAGENT, options.useragent.c_str()));
    }
    if (options.insecure) {
        sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYPEER, 0L));
        sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYHOST, 0L));
    }
}

HTTP::Curl::~Curl() noexcept {
    if (handle_) {
        curl_easy_cleanup(handle_);
    }
}

auto HTTP::Curl::get(std::string const& url, std::string const& range, headers_cb on_headers, data_cb on_data)
    -> Response {
    sdm_trace("url: %s, range: %s", url.c_str(), range.empty() ? "none" : range.c_str());
    char errbuf[CURL_ERROR_SIZE] = {};
    response_ = {};
    on_headers_ = on_headers;
    on_data_ = on_data;
    headers_done_ = false;
    stopped_ = false;
    error_ = {};
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_URL, url.c_str()));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_RANGE, range.empty() ? (char const*)nullptr : range.c_str()));
    sdm_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, errbuf));

    auto result = curl_easy_perform(handle_);
    curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, (char*)nullptr);
    on_headers_ = {};
    on_data_ = {};

    if (error_) {
        std::rethrow_exception(std::exchange(error_, {}));
    }
    if (result != CURLE_OK && !(stopped_ && result == CURLE_WRITE_ERROR)) {
        throw_error(ErrorKind::Transport, url, errbuf[0] ? errbuf : curl_easy_strerror(result));
    }
    if (!headers_done_) {
        // Body was empty, headers are still reported.
        on_headers_ = on_headers;
        this->finish_headers();
        on_headers_ = {};
    }
    return std::move(response_);
}

auto HTTP::Curl::finish_headers() -> bool {
    headers_done_ = true;
    long status = 0;
    sdm_assert_easy_curl(curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status));
    response_.status = status;
    if (on_headers_ && !on_headers_(response_)) {
        stopped_ = true;
        return false;
    }
    return true;
}

auto HTTP::Curl::recv_header(char const* data, size_t size, size_t ncount, Curl* self) noexcept -> size_t {
    auto line = str_strip({data, size * ncount});
    if (line.starts_with("HTTP/"sv)) {
        // Every redirect and interim response starts a fresh header block.
        self->response_.headers.clear();
    } else if (line.find(':') != std::string_view::npos) {
        auto [name, value] = str_split(line, ':');
        try {
            self->response_.headers.insert_or_assign(std::string(str_strip(name)), std::string(str_strip(value)));
        } catch (...) {
            self->error_ = std::current_exception();
            return 0;
        }
    }
    return size * ncount;
}

auto HTTP::Curl::recv_data(char const* data, size_t size, size_t ncount, Curl* self) noexcept -> size_t {
    try {
        if (!self->headers_done_ && !self->finish_headers()) {
            return 0;
        }
        if (self->on_data_) {
            self->on_data_({data, size * ncount});
        }
    } catch (...) {
        self->error_ = std::current_exception();
        return 0;
    }
    return size * ncount;
}
