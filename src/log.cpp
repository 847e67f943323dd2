// busq++ contributors

#include <busq++/log.hpp>

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Busq {

namespace {
constexpr const char* kLoggerName = "busq";
std::once_flag        g_logger_once;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_logger_once, [] {
        if (!spdlog::get(kLoggerName)) {
            auto log = spdlog::stderr_color_mt(kLoggerName);
            log->set_level(spdlog::level::warn);
            log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        }
    });
    return spdlog::get(kLoggerName);
}

void set_debug_level(int level) {
    spdlog::level::level_enum lvl = spdlog::level::warn;
    if (level >= 3) {
        lvl = spdlog::level::trace;
    } else if (level == 2) {
        lvl = spdlog::level::debug;
    } else if (level == 1) {
        lvl = spdlog::level::info;
    }
    logger()->set_level(lvl);
}

} // namespace Busq
