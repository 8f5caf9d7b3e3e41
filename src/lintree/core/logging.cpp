#include <lintree/core/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <lintree/core/config.hpp>

namespace lintree {

static char const logger_name[] = "lintree";

std::shared_ptr<spdlog::logger>
get_logger()
{
    static std::mutex creation_mutex;
    auto logger = spdlog::get(logger_name);
    if (logger)
        return logger;
    std::lock_guard<std::mutex> lock(creation_mutex);
    // Another thread may have created it while we were waiting.
    logger = spdlog::get(logger_name);
    if (!logger)
    {
        logger = spdlog::stdout_color_mt(logger_name);
        logger->set_level(spdlog::level::warn);
    }
    return logger;
}

void
initialize_logging(engine_config const& config)
{
    auto level = config.log_level ? *config.log_level : spdlog::level::warn;
    if (config.log_operations && *config.log_operations
        && level > spdlog::level::debug)
    {
        level = spdlog::level::debug;
    }
    get_logger()->set_level(level);
}

} // namespace lintree
