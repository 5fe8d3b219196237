#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "imgmgr/config.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace imgmgr;

static Config parse(const std::string& text)
{
    return config_from_toml(toml::parse(text));
}

TEST(Config, DefaultsWhenEmpty)
{
    const Config cfg = parse("");
    EXPECT_EQ(cfg.public_root, "");
    EXPECT_EQ(cfg.error_image, fs::path("vendor/imgmgr/error.jpg"));
    EXPECT_EQ(cfg.default_quality, 90);
    EXPECT_EQ(cfg.file_permissions, static_cast<fs::perms>(0777));
    EXPECT_EQ(cfg.directory_permissions, static_cast<fs::perms>(0777));
    EXPECT_TRUE(cfg.persist_orientation);
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_EQ(cfg.logging.file, "");
}

TEST(Config, ReadsAllSections)
{
    const Config cfg = parse(R"(
[paths]
public_root = "/srv/www"
error_image = "img/missing.png"

[output]
default_quality       = 75
file_permissions      = 0o644
directory_permissions = 0o755
persist_orientation   = false

[logging]
level = "debug"
file  = "/tmp/imgmgr.log"
)");
    EXPECT_EQ(cfg.public_root, "/srv/www");
    EXPECT_EQ(cfg.error_image, fs::path("img/missing.png"));
    EXPECT_EQ(cfg.default_quality, 75);
    EXPECT_EQ(cfg.file_permissions, static_cast<fs::perms>(0644));
    EXPECT_EQ(cfg.directory_permissions, static_cast<fs::perms>(0755));
    EXPECT_FALSE(cfg.persist_orientation);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.file, "/tmp/imgmgr.log");
}

TEST(Config, RejectsBadValues)
{
    EXPECT_THROW(parse("[output]\ndefault_quality = 101\n"), std::runtime_error);
    EXPECT_THROW(parse("[output]\nfile_permissions = -1\n"), std::runtime_error);
    EXPECT_THROW(parse("[logging]\nlevel = \"loud\"\n"), std::runtime_error);
}

TEST(Config, ErrorImagePathResolvesAgainstRoot)
{
    Config cfg;
    cfg.public_root = "/srv/www";
    EXPECT_EQ(cfg.error_image_path(), fs::path("/srv/www/vendor/imgmgr/error.jpg"));

    cfg.error_image = "/opt/placeholder.jpg";
    EXPECT_EQ(cfg.error_image_path(), fs::path("/opt/placeholder.jpg"));

    cfg.public_root.clear();
    cfg.error_image = "rel.jpg";
    EXPECT_EQ(cfg.error_image_path(), fs::path("rel.jpg"));
}

TEST(Config, LoadFromFile)
{
    imgmgr::test::TempDir tmp;
    const fs::path file = tmp.path() / "imgmgr.toml";
    imgmgr::test::write_text(file, "[output]\ndefault_quality = 60\n");

    EXPECT_EQ(load_config(file).default_quality, 60);
}

TEST(Config, LoadReportsSyntaxAndMissingFile)
{
    imgmgr::test::TempDir tmp;
    const fs::path file = tmp.path() / "broken.toml";
    imgmgr::test::write_text(file, "[output\ndefault_quality = \n");

    EXPECT_THROW(load_config(file), std::runtime_error);
    EXPECT_THROW(load_config(tmp.path() / "missing.toml"), std::runtime_error);
}

TEST(Config, LoadedLoggingSectionTakesEffect)
{
    imgmgr::test::TempDir tmp;
    const fs::path log  = tmp.path() / "imgmgr.log";
    const fs::path file = tmp.path() / "imgmgr.toml";
    imgmgr::test::write_text(file, "[logging]\nlevel = \"debug\"\nfile = '" + log.string() + "'\n");

    const Config cfg = load_config_and_logging(file);
    EXPECT_EQ(cfg.logging.level, "debug");

    IMGMGR_LOG_DEBUG("cache hit {}", "200-200/crop/a.jpg");
    spdlog::default_logger()->flush();

    std::ifstream in(log);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("cache hit 200-200/crop/a.jpg"), std::string::npos);

    ASSERT_TRUE(init_logging(LoggingConfig{}));
}

TEST(Config, UnwritableLogFileIsReported)
{
    imgmgr::test::TempDir tmp;
    const fs::path file = tmp.path() / "imgmgr.toml";
    // 父路徑是一般檔案，log 檔開不了
    imgmgr::test::write_text(tmp.path() / "plain", "x");
    imgmgr::test::write_text(file, "[logging]\nfile = '" + (tmp.path() / "plain" / "x.log").string() + "'\n");

    EXPECT_THROW(load_config_and_logging(file), std::runtime_error);
    ASSERT_TRUE(init_logging(LoggingConfig{}));
}
