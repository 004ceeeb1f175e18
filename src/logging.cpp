#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace imgmin {

void setup_logging(bool verbose) {
    // stdout gehört dem report, logs gehen nach stderr
    auto logger = spdlog::get("imgmin");
    if (!logger) {
        logger = spdlog::stderr_color_mt("imgmin");
    }
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %^%l%$ - %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(logger);
}

} // namespace imgmin
