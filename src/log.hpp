#pragma once

#include <spdlog/spdlog.h>

#include <memory>

// Named "deepzoom" logger writing to stderr. Created on first use; its level
// follows SPDLOG_LEVEL when the host calls spdlog::cfg::load_env_levels().
std::shared_ptr<spdlog::logger> engine_log();

void set_engine_log_level(spdlog::level::level_enum level);
