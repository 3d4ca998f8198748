#include "fallback.hpp"

#include "iofile.hpp"

using namespace sdm;

auto sdm::fetch_whole(HTTP& http,
                      std::string const& url,
                      fs::path const& path,
                      std::optional<std::int64_t> expected_size,
                      Progress* progress) -> std::int64_t {
    sdm_trace("fallback: %s", url.c_str());
    auto file = IO::File(path, IO::WRITE | IO::TRUNCATE | IO::SEQUENTIAL);
    auto written = std::int64_t{};
    http.get(
        url,
        {},
        [&](HTTP::Response const& response) -> bool {
            if (response.status != 200) {
                sdm_error(Protocol, fmt::format("server returned status {}", response.status));
            }
            return true;
        },
        [&](std::span<char const> data) {
            if (!file.write((std::uint64_t)written, data)) {
                sdm_error(IO, fmt::format("write failed at offset {}", written));
            }
            written += (std::int64_t)data.size();
            if (progress) {
                progress->add((std::int64_t)data.size());
            }
        });
    if (expected_size && written != *expected_size) {
        sdm_error(Protocol, fmt::format("body has {} bytes, expected {}", written, *expected_size));
    }
    return written;
}
