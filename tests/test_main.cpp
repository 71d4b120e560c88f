// tests/test_main.cpp
//
// Single doctest runner for lore_tests. Keep DOCTEST_CONFIG_IMPLEMENT in this
// file only; every other test TU includes <doctest/doctest.h> plainly.
//
// Environment:
//   CI=1            no debugger breaks, no ANSI colors
//   LORE_TEST_LOG=1 route engine/persistence logs to stderr at debug level
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>
#include <memory>
#include <string_view>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] bool EnvFlag(const char* name)
{
    const char* v = std::getenv(name);
    return v != nullptr && *v != '\0' && std::string_view(v) != "0";
}

void InstallTestLogger()
{
    std::shared_ptr<spdlog::logger> logger;
    if (EnvFlag("LORE_TEST_LOG"))
    {
        logger = std::make_shared<spdlog::logger>(
            "lore_tests", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger->set_level(spdlog::level::debug);
    }
    else
    {
        logger = std::make_shared<spdlog::logger>(
            "lore_tests", std::make_shared<spdlog::sinks::null_sink_mt>());
    }
    spdlog::set_default_logger(std::move(logger));
}

} // namespace

int main(int argc, char** argv)
{
    InstallTestLogger();

    doctest::Context context;
    context.setOption("order-by", "name"); // stable order across runs
    context.setOption("duration", true);

    if (EnvFlag("CI"))
    {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    // Command-line flags win over the defaults above.
    context.applyCommandLine(argc, argv);

    const int res = context.run();
    spdlog::shutdown();
    return res;
}
