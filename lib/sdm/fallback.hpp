#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "http.hpp"
#include "progress.hpp"

namespace sdm {
    // Sequential whole-file GET into a freshly truncated file at path.
    // No retry: any failure is final for the transfer.
    extern auto fetch_whole(HTTP& http,
                            std::string const& url,
                            fs::path const& path,
                            std::optional<std::int64_t> expected_size,
                            Progress* progress) -> std::int64_t;
}
