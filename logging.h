#pragma once

#include <string>

#include <spdlog/spdlog.h>

void init_logging(spdlog::level::level_enum level, const std::string& path);
void shutdown_logging();
spdlog::level::level_enum parse_log_level(const std::string& name, spdlog::level::level_enum fallback);
