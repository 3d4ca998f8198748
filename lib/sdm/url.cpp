#include "url.hpp"

#include <curl/curl.h>

#include <memory>

using namespace sdm;

static constexpr auto DEFAULT_FILENAME = "downloaded_file";

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const noexcept { curl_url_cleanup(handle); }
};

struct CurlFreeDeleter {
    void operator()(char* str) const noexcept { curl_free(str); }
};

using curl_str_t = std::unique_ptr<char, CurlFreeDeleter>;

static auto url_part(CURLU* handle, CURLUPart part, unsigned flags) -> std::string {
    char* value = nullptr;
    if (curl_url_get(handle, part, &value, flags) != CURLUE_OK || !value) {
        return {};
    }
    return curl_str_t(value).get();
}

// Form encoding: '+' is a space, the rest is plain percent encoding.
static auto form_decode(std::string_view str) -> std::string {
    auto plus = std::string(str);
    std::replace(plus.begin(), plus.end(), '+', ' ');
    auto length = 0;
    auto decoded = curl_str_t(curl_easy_unescape(nullptr, plus.data(), (int)plus.size(), &length));
    if (!decoded) {
        return {};
    }
    return std::string(decoded.get(), (std::size_t)length);
}

// Only the final path component is kept.
static auto clean_filename(std::string name) -> std::string {
    std::replace(name.begin(), name.end(), '\\', '/');
    name = fs::path(name).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return {};
    }
    return name;
}

auto sdm::filename_from_url(std::string const& url) -> std::string {
    auto handle = std::unique_ptr<CURLU, CurlUrlDeleter>(curl_url());
    if (!handle) {
        return DEFAULT_FILENAME;
    }
    auto const flags = CURLU_NON_SUPPORT_SCHEME | CURLU_DEFAULT_SCHEME;
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), flags) != CURLUE_OK) {
        return DEFAULT_FILENAME;
    }
    auto const query_str = url_part(handle.get(), CURLUPART_QUERY, 0);
    for (auto query = std::string_view{query_str}; !query.empty();) {
        auto [param, rest] = str_split(query, '&');
        query = rest;
        if (auto [key, value] = str_split(param, '='); key == "filename"sv) {
            if (auto name = clean_filename(form_decode(value)); !name.empty()) {
                return name;
            }
        }
    }
    if (auto name = clean_filename(url_part(handle.get(), CURLUPART_PATH, CURLU_URLDECODE)); !name.empty()) {
        return name;
    }
    return DEFAULT_FILENAME;
}

auto sdm::resolve_output(std::string const& url, std::string const& output) -> fs::path {
    if (output.empty()) {
        return fs::path(filename_from_url(url));
    }
    auto path = fs::path(output);
    auto ec = std::error_code{};
    if (fs::is_directory(path, ec) || output.ends_with('/')) {
        return path / filename_from_url(url);
    }
    return path;
}
