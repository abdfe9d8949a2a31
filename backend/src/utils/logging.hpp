#pragma once
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "../config/Config.hpp"

namespace Log
{
    inline void init(const LoggingConfig& cfg)
    {
        // Console always; file when configured
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!cfg.file.empty())
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file));

        auto logger = std::make_shared<spdlog::logger>("sessiongate", sinks.begin(), sinks.end());

        // components log through the spdlog:: free functions
        spdlog::set_default_logger(logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(spdlog::level::from_str(cfg.level));
        spdlog::flush_on(spdlog::level::info);
    }
}
