#ifndef BACKSCAN_UTILS_LOGGER_H
#define BACKSCAN_UTILS_LOGGER_H

#ifdef __cplusplus
extern "C" {
#endif
/**
 * Set the runtime log level of the backscan messages
 * @param level_str "trace", "debug", "info", "warn"/"warning", "err"/"error",
 *                  "critical" or "off" (case insensitive)
 * @return 0 on success, -1 if the name is NULL or not a level; the current
 *         level is left unchanged on failure
 */
int backscan_set_log_level(const char *level_str);

/**
 * Current runtime log level name (pointer to static storage)
 */
const char *backscan_get_log_level_string(void);

/**
 * Lowest level compiled into the library (BACKSCAN_LOG_LEVEL at build time):
 * 0=trace, 1=debug, 2=info, 3=warn, 4=error, 5=critical, 6=off
 */
int backscan_get_compiled_log_level(void);

#ifdef __cplusplus
}

#include <spdlog/common.h>

#include <string>

namespace backscan::utils::logger {

bool parse_log_level(const std::string &level_str,
                     spdlog::level::level_enum &level);

/**
 * Set the runtime log level. Requesting a level below compiled_log_level()
 * is accepted but logs a warning, since those statements are not built in.
 * @return 0 on success, -1 on an unknown level name
 */
int set_log_level(const std::string &level_str);

spdlog::level::level_enum get_log_level();

std::string get_log_level_string();

spdlog::level::level_enum compiled_log_level();

}  // namespace backscan::utils::logger
#endif

#endif  // BACKSCAN_UTILS_LOGGER_H
