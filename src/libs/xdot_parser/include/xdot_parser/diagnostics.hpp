#pragma once

#include <spdlog/logger.h>
#include <memory>

namespace xdot_parser {

// Logger used for non-fatal interpreter and loader diagnostics.
std::shared_ptr<spdlog::logger> diagnostics();
void set_diagnostics(std::shared_ptr<spdlog::logger> logger);

} // namespace xdot_parser
