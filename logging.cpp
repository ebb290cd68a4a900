#include "logging.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

void init_logging(spdlog::level::level_enum level, const std::string& path)
{
    spdlog::drop("xaudio");
    auto log = spdlog::basic_logger_mt("xaudio", path, true);
    spdlog::set_default_logger(log);
    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::flush_on(level);
}

void shutdown_logging()
{
    spdlog::shutdown();
}

spdlog::level::level_enum parse_log_level(const std::string& name, spdlog::level::level_enum fallback)
{
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
    {
        return fallback;
    }
    return level;
}
