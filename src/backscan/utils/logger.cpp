#include <backscan/utils/logger.h>

#include <algorithm>
#include <cctype>
#include <string>

#include "backscan/common/logging.h"

namespace backscan::utils::logger {

bool parse_log_level(const std::string &level_str,
                     spdlog::level::level_enum &level) {
    std::string name = level_str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    // from_str maps unknown names to off
    spdlog::level::level_enum parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    level = parsed;
    return true;
}

int set_log_level(const std::string &level_str) {
    spdlog::level::level_enum level;
    if (!parse_log_level(level_str, level)) {
        return -1;
    }

    spdlog::set_level(level);
    if (level < compiled_log_level()) {
        BACKSCAN_LOG_WARN(
            "Log level '{}' is below the compiled level '{}'; those messages "
            "are not built in",
            get_log_level_string(),
            spdlog::level::to_string_view(compiled_log_level()));
    }
    return 0;
}

spdlog::level::level_enum get_log_level() { return spdlog::get_level(); }

std::string get_log_level_string() {
    auto name = spdlog::level::to_string_view(spdlog::get_level());
    return std::string(name.data(), name.size());
}

spdlog::level::level_enum compiled_log_level() {
    return static_cast<spdlog::level::level_enum>(BACKSCAN_LOGGER_LEVEL);
}

}  // namespace backscan::utils::logger

// ==============================================================================
// C API Implementation (wraps C++ implementation)
// ==============================================================================

extern "C" {

int backscan_set_log_level(const char *level_str) {
    if (!level_str) {
        return -1;
    }
    return backscan::utils::logger::set_log_level(level_str);
}

const char *backscan_get_log_level_string() {
    static std::string level_string;
    level_string = backscan::utils::logger::get_log_level_string();
    return level_string.c_str();
}

int backscan_get_compiled_log_level() {
    return static_cast<int>(backscan::utils::logger::compiled_log_level());
}

}  // extern "C"
