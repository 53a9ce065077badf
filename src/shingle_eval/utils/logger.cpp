#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace shingle_eval {

namespace {
    // Retrieve current logger, or create one if not available
    std::shared_ptr<spdlog::logger>& get_shared_logger()
    {
        static std::shared_ptr<spdlog::logger> logger;
        return logger;
    }
} // namespace

spdlog::logger& logger()
{
    auto& shared_logger = get_shared_logger();
    if (!shared_logger) {
        shared_logger = spdlog::get("shingle_eval");
        if (!shared_logger) {
            shared_logger = spdlog::stdout_color_mt("shingle_eval");
        }
    }
    return *shared_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> x)
{
    get_shared_logger() = std::move(x);
}

} // namespace shingle_eval
