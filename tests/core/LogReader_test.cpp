#include <gtest/gtest.h>
#include "core/LogReader.hpp"
#include "support/TempProject.hpp"

using namespace sf_boost;

class LogReaderTest : public ::testing::Test {
protected:
    test_support::TempProject project_;
};

TEST_F(LogReaderTest, TailReturnsLastLinesOldestFirst) {
    auto file = project_.write("var/log/dev.log", "one\ntwo\nthree\nfour\n");

    std::vector<std::string> expected{"three", "four"};
    EXPECT_EQ(LogReader::tail(file, 2), expected);
}

TEST_F(LogReaderTest, TailOfShortFileReturnsEverything) {
    auto file = project_.write("var/log/dev.log", "only\r\nlines\n");

    std::vector<std::string> expected{"only", "lines"};
    EXPECT_EQ(LogReader::tail(file, 50), expected);
}

TEST_F(LogReaderTest, TailWithoutTrailingNewline) {
    auto file = project_.write("var/log/dev.log", "a\nb\nc");

    std::vector<std::string> expected{"b", "c"};
    EXPECT_EQ(LogReader::tail(file, 2), expected);
}

TEST_F(LogReaderTest, TailAcrossBlocks) {
    std::string content;
    for (int i = 0; i < 5000; ++i) {
        content += "[2024-01-01] app.INFO: line " + std::to_string(i) + "\n";
    }
    auto file = project_.write("var/log/dev.log", content);

    auto lines = LogReader::tail(file, 1000);
    ASSERT_EQ(lines.size(), 1000u);
    EXPECT_EQ(lines.front(), "[2024-01-01] app.INFO: line 4000");
    EXPECT_EQ(lines.back(), "[2024-01-01] app.INFO: line 4999");
}

TEST_F(LogReaderTest, EmptyFileAndZeroCount) {
    auto empty = project_.write("var/log/empty.log", "");
    EXPECT_TRUE(LogReader::tail(empty, 10).empty());

    auto file = project_.write("var/log/dev.log", "x\n");
    EXPECT_TRUE(LogReader::tail(file, 0).empty());
}

TEST_F(LogReaderTest, MissingFileThrows) {
    EXPECT_THROW(LogReader::tail(project_.root() / "nope.log", 5), std::runtime_error);
}

TEST(LogReaderFilterTest, ErrorLinesAnyCase) {
    std::vector<std::string> lines{
        "[..] request.INFO: Matched route",
        "[..] request.ERROR: Uncaught PHP Exception",
        "[..] php.critical: Fatal",
        "[..] app.DEBUG: no problem",
        "[..] app.EMERGENCY: disk full",
        "[..] app.INFO: error_reporting changed"
    };

    auto errors = LogReader::error_lines(lines);
    ASSERT_EQ(errors.size(), 4u);
    EXPECT_EQ(errors[0], lines[1]);
    EXPECT_EQ(errors[1], lines[2]);
    EXPECT_EQ(errors[2], lines[4]);
    EXPECT_EQ(errors[3], lines[5]);
}

TEST(LogReaderFilterTest, Join) {
    EXPECT_EQ(LogReader::join({}), "");
    EXPECT_EQ(LogReader::join({"a", "b"}), "a\nb\n");
}
