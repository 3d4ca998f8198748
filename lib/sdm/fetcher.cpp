#include "fetcher.hpp"

using namespace sdm;

static auto check_partial(HTTP::Response const& response, ChunkRange const& chunk, std::int64_t total_size) -> void {
    if (response.status != 206) {
        sdm_error(Protocol, fmt::format("expected status 206, got {}", response.status));
    }
    auto header = response.header("Content-Range");
    if (!header) {
        return;
    }
    auto content_range = ContentRange::parse(*header);
    if (!content_range) {
        sdm_error(Protocol, fmt::format("invalid Content-Range: {}", *header));
    }
    if (content_range->start != chunk.start || content_range->end != chunk.end) {
        sdm_error(Protocol, fmt::format("Content-Range {} does not match {}", *header, chunk.range()));
    }
    if (content_range->total && *content_range->total != total_size) {
        sdm_error(Protocol, fmt::format("total size changed from {} to {}", total_size, *content_range->total));
    }
}

auto sdm::fetch_chunk(HTTP& http,
                      std::string const& url,
                      ChunkRange const& chunk,
                      std::int64_t total_size,
                      IO& file,
                      Progress* progress) -> std::int64_t {
    if (chunk.size() <= 0) {
        return 0;
    }
    sdm_trace("chunk #%u: %lld-%lld", chunk.index, (long long)chunk.start, (long long)chunk.end);
    auto received = std::int64_t{};
    try {
        http.get(
            url,
            chunk.range(),
            [&](HTTP::Response const& response) -> bool {
                check_partial(response, chunk, total_size);
                return true;
            },
            [&](std::span<char const> data) {
                if ((std::int64_t)data.size() > chunk.size() - received) {
                    sdm_error(Protocol, "server sent more bytes than requested");
                }
                if (!file.write((std::uint64_t)(chunk.start + received), data)) {
                    sdm_error(IO, fmt::format("write failed at offset {}", chunk.start + received));
                }
                received += (std::int64_t)data.size();
                if (progress) {
                    progress->add((std::int64_t)data.size());
                }
            });
        if (received != chunk.size()) {
            sdm_error(Protocol, fmt::format("short body: {} of {} bytes", received, chunk.size()));
        }
    } catch (Error const&) {
        if (progress) {
            progress->rollback(received);
        }
        throw;
    }
    return received;
}
