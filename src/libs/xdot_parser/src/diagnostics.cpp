#include <xdot_parser/diagnostics.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace xdot_parser {

namespace {

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> diagnostics() {
    auto& logger = logger_slot();
    if (logger) return logger;

    try {
        logger = spdlog::get("xdot");
        if (!logger) logger = spdlog::stderr_color_mt("xdot");
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

void set_diagnostics(std::shared_ptr<spdlog::logger> logger) {
    logger_slot() = std::move(logger);
}

} // namespace xdot_parser
