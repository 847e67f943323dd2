// busq++ contributors

#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace Busq {

// Shared "busq" logger (stderr, colour). Created on first use at warn level.
std::shared_ptr<spdlog::logger> logger();

// Verbosity switch: 0 warn, 1 info, 2 debug, 3 and above trace
void set_debug_level(int level);

} // namespace Busq
