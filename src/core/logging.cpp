#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <memory>

int parse_log_level(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str answers "off" for names it does not know
    if (lvl == spdlog::level::off && level != "off") {
        return static_cast<int>(spdlog::level::info);
    }
    return static_cast<int>(lvl);
}

bool init_logging(const std::string& path, const std::string& level) {
    auto lvl = static_cast<spdlog::level::level_enum>(parse_log_level(level));

    spdlog::drop("imagetea");
    std::shared_ptr<spdlog::logger> logger;
    bool ok = true;
    try {
        logger = spdlog::basic_logger_mt("imagetea", path);
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::create<spdlog::sinks::null_sink_mt>("imagetea");
        ok = false;
    }

    logger->set_level(lvl);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);
    return ok;
}
