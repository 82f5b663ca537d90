#ifndef BACKSCAN_COMMON_LOGGING_H
#define BACKSCAN_COMMON_LOGGING_H

#include <backscan/config.h>

// Statements below BACKSCAN_LOGGER_LEVEL are compiled out entirely.
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL BACKSCAN_LOGGER_LEVEL
#endif

#include <spdlog/spdlog.h>

#define BACKSCAN_LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define BACKSCAN_LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define BACKSCAN_LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define BACKSCAN_LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define BACKSCAN_LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

#endif  // BACKSCAN_COMMON_LOGGING_H
