#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "imgmgr/logging.hpp"
#include "test_support.hpp"

using namespace imgmgr;

TEST(Logging, WritesToFileSink)
{
    imgmgr::test::TempDir tmp;
    const auto file = tmp.path() / "imgmgr.log";

    LoggingConfig cfg;
    cfg.level = "debug";
    cfg.file  = file.string();
    ASSERT_TRUE(init_logging(cfg));

    IMGMGR_LOG_DEBUG("resize {}x{}", 200, 150);
    IMGMGR_LOG_WARN("falling back to {}", "error.jpg");
    spdlog::default_logger()->flush();

    std::ifstream in(file);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    EXPECT_NE(text.find("resize 200x150"), std::string::npos);
    EXPECT_NE(text.find("falling back to error.jpg"), std::string::npos);
    EXPECT_NE(text.find("[warning]"), std::string::npos);
    EXPECT_NE(text.find("test_logging.cpp"), std::string::npos);

    // 換回只寫 stderr，釋放檔案
    ASSERT_TRUE(init_logging(LoggingConfig{}));
    EXPECT_EQ(spdlog::default_logger()->name(), "imgmgr");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);
}

TEST(Logging, LevelFiltersMessages)
{
    imgmgr::test::TempDir tmp;
    const auto file = tmp.path() / "quiet.log";

    LoggingConfig cfg;
    cfg.level = "error";
    cfg.file  = file.string();
    ASSERT_TRUE(init_logging(cfg));

    IMGMGR_LOG_INFO("cache hit {}", "a.jpg");
    IMGMGR_LOG_ERROR("encode failed");
    spdlog::default_logger()->flush();

    std::ifstream in(file);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str().find("cache hit"), std::string::npos);
    EXPECT_NE(ss.str().find("encode failed"), std::string::npos);

    ASSERT_TRUE(init_logging(LoggingConfig{}));
}
