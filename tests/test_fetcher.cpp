#include <gtest/gtest.h>

#include <sdm/fetcher.hpp>
#include <sdm/iofile.hpp>

#include "fake_http.hpp"

using namespace sdm;

class FetcherTest : public TempDirTest {
protected:
    FakeServer server;
    FakeHttp http{server};
    std::string const url = "http://example.com/file.bin";

    void SetUp() override {
        TempDirTest::SetUp();
        server.content = make_content(100000);
        server.piece = 1000;
    }

    auto open_output() -> IO::File {
        auto file = IO::File(dir / "out.bin", IO::WRITE | IO::TRUNCATE | IO::RANDOM_ACCESS);
        EXPECT_TRUE(file.resize(0, server.content.size()));
        return file;
    }

    auto expect_failure(ChunkRange const& chunk, IO& file, ErrorKind kind) -> void {
        auto progress = Progress(server.content.size());
        try {
            fetch_chunk(http, url, chunk, (std::int64_t)server.content.size(), file, &progress);
            FAIL() << "expected an error";
        } catch (Error const& e) {
            EXPECT_EQ(e.kind(), kind) << e.what();
        }
        EXPECT_EQ(progress.done(), 0);
        error_stack().clear();
    }
};

TEST_F(FetcherTest, WritesOnlyItsOwnRange) {
    auto file = open_output();
    auto progress = Progress(server.content.size());
    auto const chunk = ChunkRange{.index = 1, .start = 25000, .end = 49999};
    auto const written = fetch_chunk(http, url, chunk, (std::int64_t)server.content.size(), file, &progress);
    EXPECT_EQ(written, 25000);
    EXPECT_EQ(progress.done(), 25000);
    EXPECT_EQ(server.ranges_seen.back(), "25000-49999");

    auto const result = read_file(dir / "out.bin");
    ASSERT_EQ(result.size(), server.content.size());
    EXPECT_EQ(result.substr(0, 25000), std::string(25000, '\0'));
    EXPECT_EQ(result.substr(25000, 25000), server.content.substr(25000, 25000));
    EXPECT_EQ(result.substr(50000), std::string(50000, '\0'));
}

TEST_F(FetcherTest, EmptyChunkMakesNoRequest) {
    auto file = open_output();
    auto const chunk = ChunkRange{.index = 0, .start = 0, .end = -1};
    EXPECT_EQ(fetch_chunk(http, url, chunk, 0, file, nullptr), 0);
    EXPECT_EQ(server.requests, 0u);
}

TEST_F(FetcherTest, WrongStatusIsProtocolError) {
    auto file = open_output();
    server.faults[0] = {FakeServer::Fault::WrongStatus, 1};
    expect_failure({.index = 0, .start = 0, .end = 9999}, file, ErrorKind::Protocol);
}

TEST_F(FetcherTest, RangeIgnoredIsProtocolError) {
    auto file = open_output();
    server.ignore_ranges = true;
    expect_failure({.index = 0, .start = 0, .end = 9999}, file, ErrorKind::Protocol);
}

TEST_F(FetcherTest, TruncatedBodyRollsBackProgress) {
    auto file = open_output();
    server.faults[10000] = {FakeServer::Fault::Truncate, 1};
    expect_failure({.index = 1, .start = 10000, .end = 19999}, file, ErrorKind::Protocol);
}

TEST_F(FetcherTest, ResetMidStreamIsTransportError) {
    auto file = open_output();
    server.faults[10000] = {FakeServer::Fault::Reset, 1};
    expect_failure({.index = 1, .start = 10000, .end = 19999}, file, ErrorKind::Transport);
}

TEST_F(FetcherTest, TotalSizeChangeIsProtocolError) {
    auto file = open_output();
    auto progress = Progress(std::nullopt);
    try {
        fetch_chunk(http, url, {.index = 0, .start = 0, .end = 999}, 12345, file, &progress);
        FAIL() << "expected an error";
    } catch (Error const& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
    error_stack().clear();
}

TEST_F(FetcherTest, OversizedBodyIsProtocolError) {
    struct Oversized final : HTTP {
        auto get(std::string const&, std::string const&, headers_cb on_headers, data_cb on_data)
            -> Response override {
            auto response = Response{.status = 206};
            on_headers(response);
            auto const body = std::string(20, 'x');
            on_data(body);
            return response;
        }
    } oversized;
    auto file = open_output();
    try {
        fetch_chunk(oversized, url, {.index = 0, .start = 0, .end = 9}, 100000, file, nullptr);
        FAIL() << "expected an error";
    } catch (Error const& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
    error_stack().clear();
}

// Only size, resize, read and write make up the IO surface a fetch relies on.
struct MemoryIO final : IO {
    std::string data;

    auto size() const noexcept -> std::uint64_t override { return data.size(); }

    auto resize(std::uint64_t offset, std::uint64_t count) noexcept -> bool override {
        data.resize(offset + count);
        return true;
    }

    auto read(std::uint64_t offset, std::span<char> dst) const noexcept -> bool override {
        if (offset + dst.size() > data.size()) {
            return false;
        }
        std::copy_n(data.data() + offset, dst.size(), dst.data());
        return true;
    }

    auto write(std::uint64_t offset, std::span<char const> src) noexcept -> bool override {
        if (offset + src.size() > data.size()) {
            return false;
        }
        std::copy(src.begin(), src.end(), data.begin() + (std::ptrdiff_t)offset);
        return true;
    }
};

TEST_F(FetcherTest, WritesIntoAnyIO) {
    auto memory = MemoryIO{};
    ASSERT_TRUE(memory.resize(0, server.content.size()));
    auto const chunk = ChunkRange{.index = 3, .start = 75000, .end = 99999};
    EXPECT_EQ(fetch_chunk(http, url, chunk, (std::int64_t)server.content.size(), memory, nullptr), 25000);
    EXPECT_EQ(memory.data.substr(75000), server.content.substr(75000));
    EXPECT_EQ(memory.data.substr(0, 75000), std::string(75000, '\0'));
}

TEST_F(FetcherTest, WriteFailureIsIOError) {
    auto readonly = [&] {
        { auto file = IO::File(dir / "ro.bin", IO::WRITE); }
        return IO::File(dir / "ro.bin", IO::READ);
    }();
    expect_failure({.index = 0, .start = 0, .end = 999}, readonly, ErrorKind::IO);
}
