#pragma once
#include <string>

#include "common.hpp"

namespace sdm {
    // "filename" query parameter if present, else the last path segment, else "downloaded_file".
    extern auto filename_from_url(std::string const& url) -> std::string;

    // An empty output or an existing directory gets the name derived from the url.
    extern auto resolve_output(std::string const& url, std::string const& output) -> fs::path;
}
