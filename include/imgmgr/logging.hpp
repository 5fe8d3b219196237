#pragma once

// 編譯期開放所有等級，實際輸出由 logger level 決定
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <string>

#include <spdlog/spdlog.h>

namespace imgmgr {

struct LoggingConfig {
    std::string level = "info";  // trace / debug / info / warn / error / critical / off
    std::string file;            // 空字串 → 不寫檔
};

// 建立名為 "imgmgr" 的 logger（stderr，外加可選的檔案 sink）並設為預設
// spdlog 丟例外時回傳 false；未初始化前使用 spdlog 內建的預設 logger
bool init_logging(const LoggingConfig& config);

} // namespace imgmgr

#define IMGMGR_LOG_TRACE(...)    SPDLOG_TRACE(__VA_ARGS__)
#define IMGMGR_LOG_DEBUG(...)    SPDLOG_DEBUG(__VA_ARGS__)
#define IMGMGR_LOG_INFO(...)     SPDLOG_INFO(__VA_ARGS__)
#define IMGMGR_LOG_WARN(...)     SPDLOG_WARN(__VA_ARGS__)
#define IMGMGR_LOG_ERROR(...)    SPDLOG_ERROR(__VA_ARGS__)
#define IMGMGR_LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
