#include <gtest/gtest.h>

#include <sdm/url.hpp>

#include "fake_http.hpp"

using namespace sdm;

TEST(FilenameTest, PathBasename) {
    EXPECT_EQ(filename_from_url("http://example.com/path/to/file.zip"), "file.zip");
    EXPECT_EQ(filename_from_url("https://example.com/archive.tar.gz?token=abc"), "archive.tar.gz");
}

TEST(FilenameTest, QueryParameterWins) {
    EXPECT_EQ(filename_from_url("http://example.com/download?id=7&filename=report.pdf"), "report.pdf");
    EXPECT_EQ(filename_from_url("http://example.com/get.php?filename=my%20file.txt"), "my file.txt");
}

TEST(FilenameTest, QueryUsesFormDecoding) {
    EXPECT_EQ(filename_from_url("http://example.com/x?filename=c%2B%2B+notes.txt"), "c++ notes.txt");
    EXPECT_EQ(filename_from_url("http://example.com/x?filename=100%25.txt"), "100%.txt");
}

TEST(FilenameTest, PathIsDecoded) {
    EXPECT_EQ(filename_from_url("http://example.com/a%20b.txt"), "a b.txt");
}

TEST(FilenameTest, FallsBackToDefault) {
    EXPECT_EQ(filename_from_url("http://example.com/"), "downloaded_file");
    EXPECT_EQ(filename_from_url("http://example.com"), "downloaded_file");
    EXPECT_EQ(filename_from_url("http://example.com/dir/"), "downloaded_file");
    EXPECT_EQ(filename_from_url("http://example.com/x?filename="), "x");
}

TEST(FilenameTest, OnlyFinalComponentIsKept) {
    EXPECT_EQ(filename_from_url("http://example.com/x?filename=../../etc/passwd"), "passwd");
    EXPECT_EQ(filename_from_url("http://example.com/x?filename=..%5C..%5Cboot.ini"), "boot.ini");
    EXPECT_EQ(filename_from_url("http://example.com/x?filename=.."), "x");
}

TEST(FilenameTest, SchemeIsOptional) {
    EXPECT_EQ(filename_from_url("example.com/files/data.bin"), "data.bin");
}

class ResolveOutputTest : public TempDirTest {};

TEST_F(ResolveOutputTest, EmptyUsesDerivedName) {
    EXPECT_EQ(resolve_output("http://example.com/file.zip", ""), fs::path("file.zip"));
}

TEST_F(ResolveOutputTest, ExistingDirectory) {
    EXPECT_EQ(resolve_output("http://example.com/file.zip", dir.string()), dir / "file.zip");
}

TEST_F(ResolveOutputTest, TrailingSlashMeansDirectory) {
    auto const output = (dir / "new").string() + "/";
    EXPECT_EQ(resolve_output("http://example.com/file.zip", output), fs::path(output) / "file.zip");
}

TEST_F(ResolveOutputTest, ExplicitFile) {
    auto const output = (dir / "renamed.bin").string();
    EXPECT_EQ(resolve_output("http://example.com/file.zip", output), fs::path(output));
}
