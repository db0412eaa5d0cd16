#pragma once
#include <filesystem>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // Returns false when the file sink cannot be created; the default
    // (console) logger stays in place in that case.
    inline bool init(const std::string& path, bool verbose = false)
    {
        auto level = verbose ? spdlog::level::debug : spdlog::level::info;

        try {
            std::filesystem::path p(path);
            if (p.has_parent_path()) {
                std::filesystem::create_directories(p.parent_path());
            }

            auto file_logger = spdlog::basic_logger_mt("file_logger", path);

            // Make file logger the default
            spdlog::set_default_logger(file_logger);
        }
        catch (const std::exception& e) {
            std::cerr << "warning: cannot open log file '" << path << "': " << e.what() << "\n";
            spdlog::set_level(spdlog::level::warn);
            return false;
        }

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
        return true;
    }
}
