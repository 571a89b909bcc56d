#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Hashing ─────────────────────────────────────────────────

TEST(Utils, Md5KnownVectors) {
    EXPECT_EQ(md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5_hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(md5_hex("The quick brown fox jumps over the lazy dog"),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(Utils, FileMd5MatchesStringMd5) {
    fs::path path = fs::temp_directory_path() / ("fleet_md5_" + std::to_string(getpid()));
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    EXPECT_EQ(compute_file_md5(path), md5_hex("abc"));
    fs::remove(path);
}

TEST(Utils, FileMd5MissingIsEmpty) {
    EXPECT_EQ(compute_file_md5("/nonexistent/fleet/file"), "");
}

// ── parse_md5_from_output ───────────────────────────────────

TEST(Utils, ParseMd5FromMd5sumLine) {
    EXPECT_EQ(parse_md5_from_output("900150983cd24fb0d6963f7d28e17f72  /etc/app.conf\n"),
              "900150983cd24fb0d6963f7d28e17f72");
}

TEST(Utils, ParseMd5SkipsBannerNoise) {
    std::string out = "Welcome to host\nLast login: today\n"
                      "900150983CD24FB0D6963F7D28E17F72  file\n";
    EXPECT_EQ(parse_md5_from_output(out), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(Utils, ParseMd5RejectsLongerHexRuns) {
    // 40 hex chars: a SHA-1, not an MD5
    EXPECT_EQ(parse_md5_from_output("a9993e364706816aba3e25717850c26c9cd0d89d  file"), "");
    EXPECT_EQ(parse_md5_from_output("md5sum: /etc/app.conf: No such file or directory"), "");
    EXPECT_EQ(parse_md5_from_output(""), "");
}

// ── shell_quote ─────────────────────────────────────────────

TEST(Utils, ShellQuotePlain) {
    EXPECT_EQ(shell_quote("/etc/app.conf"), "'/etc/app.conf'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, ShellQuoteEmbeddedQuote) {
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("$(rm -rf /)"), "'$(rm -rf /)'");
}

// ── split_lines ─────────────────────────────────────────────

TEST(Utils, SplitLines) {
    EXPECT_EQ(split_lines("a\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_lines("a\r\nb"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_lines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_TRUE(split_lines("").empty());
}

// ── Numbers and time ────────────────────────────────────────

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("-7"), -7);
    EXPECT_EQ(safe_stoi("abc"), 0);
    EXPECT_EQ(safe_stoi("", 5), 5);
    EXPECT_EQ(safe_stoi("99999999999999999999", -1), -1);
}

TEST(Utils, Trim) {
    std::string s = "  \thello world\r\n";
    trim(s);
    EXPECT_EQ(s, "hello world");
    EXPECT_EQ(trimmed(" \n "), "");
}

TEST(Utils, FileTimestampFormat) {
    std::string stamp = file_timestamp(std::chrono::system_clock::now());
    ASSERT_EQ(stamp.size(), 15u);
    EXPECT_EQ(stamp[8], '_');
    EXPECT_EQ(stamp.find_first_not_of("0123456789_"), std::string::npos);
}

TEST(Utils, RemainingMs) {
    EXPECT_EQ(remaining_ms(Clock::now() - std::chrono::seconds(1)), 0);
    long long left = remaining_ms(deadline_in(std::chrono::seconds(10)));
    EXPECT_GT(left, 9000);
    EXPECT_LE(left, 10000);
}
