#include "probe.hpp"

using namespace sdm;

static auto parse_partial(HTTP::Response const& response) -> std::int64_t {
    auto header = response.header("Content-Range");
    if (!header) {
        sdm_error(Protocol, "206 without Content-Range");
    }
    auto content_range = ContentRange::parse(*header);
    if (!content_range || !content_range->total || !content_range->start) {
        sdm_error(Protocol, fmt::format("invalid Content-Range: {}", *header));
    }
    auto const total = *content_range->total;
    if (*content_range->start != 0 || *content_range->end != std::min(std::int64_t{1}, total - 1)) {
        sdm_error(Protocol, fmt::format("Content-Range does not match bytes=0-1: {}", *header));
    }
    return total;
}

static auto parse_unsatisfiable(HTTP::Response const& response) -> std::int64_t {
    auto header = response.header("Content-Range");
    if (!header) {
        sdm_error(Protocol, "416 without Content-Range");
    }
    auto content_range = ContentRange::parse(*header);
    if (!content_range || content_range->total != 0) {
        sdm_error(Protocol, fmt::format("416 for a non empty resource: {}", *header));
    }
    return 0;
}

static auto parse_length(HTTP::Response const& response) -> std::optional<std::int64_t> {
    if (auto header = response.header("Content-Length")) {
        if (auto length = from_dec(str_strip(*header)); length && *length >= 0) {
            return length;
        }
    }
    return std::nullopt;
}

auto sdm::probe(HTTP& http, std::string const& url, fs::path const& path) -> TransferSpec {
    sdm_trace("probe: %s", url.c_str());
    auto spec = TransferSpec{.url = url, .path = path};
    http.get(
        url,
        "0-1",
        [&](HTTP::Response const& response) -> bool {
            auto const accept = response.header("Accept-Ranges");
            auto const refused = accept && str_eq_ci(str_strip(*accept), "none"sv);
            switch (response.status) {
                case 206:
                    spec.total_size = parse_partial(response);
                    spec.supports_ranges = !refused;
                    break;
                case 416:
                    spec.total_size = parse_unsatisfiable(response);
                    spec.supports_ranges = !refused;
                    break;
                case 200:
                    spec.total_size = parse_length(response);
                    spec.supports_ranges = false;
                    break;
                default:
                    sdm_error(Protocol, fmt::format("unexpected status {}", response.status));
            }
            return false;
        },
        [](std::span<char const>) {});
    return spec;
}
