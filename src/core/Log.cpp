#include "core/Log.h"

#include <spdlog/sinks/rotating_file_sink.h>

#include <cctype>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace lore::core {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger,
                              spdlog::level::level_enum level) {
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

} // namespace

bool LogInit(const fs::path& logDir, spdlog::level::level_enum level)
{
    std::error_code ec;
    fs::create_directories(logDir, ec);

    const auto file = (logDir / "lore.log").string();

    std::shared_ptr<spdlog::logger> logger;
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4);
        logger = std::make_shared<spdlog::logger>("lore", std::move(sink));
    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::warn("LogInit: cannot open {} ({})", file, ex.what());
        return false;
    }

    g_logger = logger;
    configure_default_logger(g_logger, level);
    spdlog::info("Logging started at {}", file);
    return true;
}

void LogShutdown()
{
    if (!g_logger)
        return;

    spdlog::info("Logging stopped");
    g_logger->flush();

    // Dropping the default logger would leave spdlog::info() & co. without a target;
    // swap in a sink-less one so late log calls are discarded instead.
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("lore"));
    g_logger.reset();
}

bool ParseLogLevel(std::string_view text, spdlog::level::level_enum& out) noexcept
{
    std::string s;
    s.reserve(text.size());
    for (char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (s == "trace")                    { out = spdlog::level::trace;    return true; }
    if (s == "debug")                    { out = spdlog::level::debug;    return true; }
    if (s == "info")                     { out = spdlog::level::info;     return true; }
    if (s == "warn" || s == "warning")   { out = spdlog::level::warn;     return true; }
    if (s == "error" || s == "err")      { out = spdlog::level::err;      return true; }
    if (s == "critical" || s == "fatal") { out = spdlog::level::critical; return true; }
    if (s == "off")                      { out = spdlog::level::off;      return true; }
    return false;
}

} // namespace lore::core
