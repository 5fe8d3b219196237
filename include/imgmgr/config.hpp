#pragma once

#include <filesystem>
#include <string>

#include <toml++/toml.hpp>

#include "imgmgr/logging.hpp"

namespace imgmgr {

// 設定檔（TOML）：
//
//   [paths]
//   public_root = "/var/www/public"
//   error_image = "vendor/imgmgr/error.jpg"   # 相對路徑以 public_root 為基準
//
//   [output]
//   default_quality       = 90
//   file_permissions      = 0o777
//   directory_permissions = 0o777
//   persist_orientation   = true
//
//   [logging]
//   level = "info"
//   file  = ""
struct Config {
    std::string public_root;
    std::filesystem::path error_image = "vendor/imgmgr/error.jpg";

    int  default_quality     = 90;
    std::filesystem::perms file_permissions      = static_cast<std::filesystem::perms>(0777);
    std::filesystem::perms directory_permissions = static_cast<std::filesystem::perms>(0777);
    bool persist_orientation = true;

    LoggingConfig logging;

    // 絕對路徑照用，相對路徑接在 public_root 後面
    std::filesystem::path error_image_path() const;
};

// 缺少的 key 用預設值；值不合法 → std::runtime_error("config: ...")
Config config_from_toml(const toml::table& tbl);

// 讀檔失敗、TOML 語法錯誤 → std::runtime_error("config: ...")
Config load_config(const std::filesystem::path& path);

// load_config 之後依 [logging] 重建預設 logger
// logger 建不起來（例如 log 檔開不了）→ std::runtime_error("config: ...")
Config load_config_and_logging(const std::filesystem::path& path);

} // namespace imgmgr
