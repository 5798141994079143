#include "repart/log.hpp"
#include <cstring>

namespace repart {

std::atomic<log_level> g_log_level{log_level::warn};

log_level parse_log_level(const char* name) {
    if (!name) return log_level::warn;
    if (std::strcmp(name, "off") == 0) return log_level::off;
    if (std::strcmp(name, "error") == 0) return log_level::error;
    if (std::strcmp(name, "info") == 0) return log_level::info;
    if (std::strcmp(name, "debug") == 0) return log_level::debug;
    return log_level::warn;
}

}  // namespace repart
