#include "imgmgr/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace imgmgr {

bool init_logging(const LoggingConfig& config)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;

        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!config.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
        }

        auto logger = std::make_shared<spdlog::logger>("imgmgr", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");

        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);

        return true;
    } catch (const spdlog::spdlog_ex&) {
        return false;
    }
}

} // namespace imgmgr
