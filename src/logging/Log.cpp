#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

void logsys::init(const Options& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    if (opts.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string fileError;
    if (!opts.file.empty()) {
        std::error_code ec;
        if (opts.file.has_parent_path())
            fs::create_directories(opts.file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opts.file.string(), 1 << 20, 4)); // 1MB * 4
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    // Never leave the process without a sink to report through.
    if (sinks.empty() && !fileError.empty())
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    g_logger = std::make_shared<spdlog::logger>("veggiechain", sinks.begin(), sinks.end());
    g_logger->set_level(opts.level);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);
    if (!fileError.empty())
        spdlog::error("Log file {} unavailable: {}", opts.file.string(), fileError);
    spdlog::debug("Logging started");
}

std::shared_ptr<spdlog::logger> logsys::get() { return g_logger ? g_logger : spdlog::default_logger(); }

bool logsys::parse_level(std::string_view text, spdlog::level::level_enum& out) {
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "warning") s = "warn";
    if (s == "err") s = "error";

    // spdlog::level::from_str maps unknown names to "off"; only accept exact names.
    const auto lvl = spdlog::level::from_str(s);
    if (lvl == spdlog::level::off && s != "off")
        return false;
    out = lvl;
    return true;
}
