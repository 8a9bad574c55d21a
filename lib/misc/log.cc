#include <mutex>

#include "glove/misc/log.hpp"
#include "spdlog/pattern_formatter.h"

namespace glove {

int GloveLogger::global_logging_level_ = 2;

static const char* LOGGER_NAME = "glove";

GloveLogger::GloveLogger()
{
    static std::once_flag registered;
    std::call_once(registered, []() {
        auto logger = spdlog::stdout_color_mt(LOGGER_NAME);
        // messages carry their own line ending
        logger->set_formatter(std::unique_ptr<spdlog::formatter>(new spdlog::pattern_formatter(
            "[%^%-8l%$] %Y-%m-%d %H:%M:%S %v", spdlog::pattern_time_type::local, "")));
        logger->set_level(spdlog::level::info);
    });
    logger_ = spdlog::get(LOGGER_NAME);
}

std::shared_ptr<spdlog::logger>& GloveLogger::get_logger() {
    return logger_;
}

void GloveLogger::set_log_level(int level) {
    global_logging_level_ = level;
    spdlog::level::level_enum lvl;
    switch(level) {
        case 0: lvl = spdlog::level::off; break;
        case 1: lvl = spdlog::level::warn; break;
        case 2: lvl = spdlog::level::info; break;
        case 3: lvl = spdlog::level::debug; break;
        default: lvl = spdlog::level::trace; break;
    }
    logger_->set_level(lvl);
}

int GloveLogger::get_log_level() {
    return global_logging_level_;
}

}
