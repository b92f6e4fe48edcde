#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> engine_log()
{
    static const std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get("deepzoom")) return existing;
        auto created = spdlog::stderr_color_mt("deepzoom");
        created->set_pattern("[%^%l%$ +%o] [%n] %v");
        return created;
    }();
    return logger;
}

void set_engine_log_level(spdlog::level::level_enum level)
{
    engine_log()->set_level(level);
}
