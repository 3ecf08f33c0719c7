#include "Log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <system_error>
#include <vector>

namespace maze::logsys {

namespace fs = std::filesystem;

static std::shared_ptr<spdlog::logger> g_logger;

void Init(const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;

    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (options.file)
    {
        std::error_code ec;
        if (options.file->has_parent_path())
            fs::create_directories(options.file->parent_path(), ec);

        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), true));
        }
        catch (const spdlog::spdlog_ex& e)
        {
            // Keep going with whatever sinks we have; report once they exist.
            if (!sinks.empty())
            {
                spdlog::logger tmp("maze", sinks.begin(), sinks.end());
                tmp.warn("could not open log file {}: {}", options.file->string(), e.what());
            }
        }
    }

    if (sinks.empty())
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>("maze", sinks.begin(), sinks.end());
    logger->set_level(options.level);

    g_logger = logger;
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);
    spdlog::debug("Logging started");
}

void Shutdown()
{
    if (g_logger)
        g_logger->flush();
    g_logger.reset();

    // The default logger must stay non-null: core code logs through it.
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "maze", std::make_shared<spdlog::sinks::null_sink_mt>()));
}

std::shared_ptr<spdlog::logger> Get() { return g_logger; }

} // namespace maze::logsys
