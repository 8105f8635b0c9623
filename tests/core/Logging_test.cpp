#include <gtest/gtest.h>
#include "core/Logging.hpp"
#include "support/TempProject.hpp"

using namespace sf_boost;

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("critical"), spdlog::level::critical);
    EXPECT_THROW(parse_log_level("verbose"), std::invalid_argument);
    EXPECT_THROW(parse_log_level("INFO"), std::invalid_argument);
}

TEST(LoggingTest, WritesToLogFile) {
    test_support::TempProject project;
    auto log_file = project.root() / "server.log";

    configure_logging("debug", log_file.string());
    spdlog::debug("debug record");
    spdlog::warn("warning record");
    spdlog::default_logger()->flush();

    std::string content = project.read("server.log");
    EXPECT_NE(content.find("debug record"), std::string::npos);
    EXPECT_NE(content.find("warning record"), std::string::npos);

    configure_logging("info");
    spdlog::debug("not written");
    EXPECT_EQ(spdlog::default_logger()->name(), "symfony-boost");
    EXPECT_EQ(project.read("server.log").find("not written"), std::string::npos);
}
