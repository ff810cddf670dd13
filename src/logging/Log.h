#pragma once
#include <filesystem>
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace logsys {
    struct Options {
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = true;
        std::filesystem::path file;      // empty = no file sink; rotates at 1MB * 4
    };

    void init(const Options& opts);      // installs "veggiechain" as the default logger
    std::shared_ptr<spdlog::logger> get();

    // "trace|debug|info|warn|error|critical|off" (case-insensitive). False on anything else.
    bool parse_level(std::string_view text, spdlog::level::level_enum& out);
}
