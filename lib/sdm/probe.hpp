#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "common.hpp"
#include "http.hpp"

namespace sdm {
    struct TransferSpec {
        std::string url = {};
        fs::path path = {};
        std::optional<std::int64_t> total_size = {};
        bool supports_ranges = {};
    };

    // Issues a "bytes=0-1" GET and reads only its headers.
    // A range is trusted only when the server actually answers 206 with a matching Content-Range.
    extern auto probe(HTTP& http, std::string const& url, fs::path const& path) -> TransferSpec;
}
