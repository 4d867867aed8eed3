#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // File logger as the process default. Console output belongs to the menu.
    inline void init(const std::string& path, spdlog::level::level_enum level)
    {
        auto file_logger = spdlog::basic_logger_mt("ledger", path);
        spdlog::set_default_logger(file_logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] [%n] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }

    // Components accept an injected logger; null means "use the default".
    inline std::shared_ptr<spdlog::logger> orDefault(std::shared_ptr<spdlog::logger> logger)
    {
        return logger ? std::move(logger) : spdlog::default_logger();
    }
}
