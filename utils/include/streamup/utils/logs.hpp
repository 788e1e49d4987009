#ifndef STREAMUP_UTILS_LOGS_HPP
#define STREAMUP_UTILS_LOGS_HPP

#include <spdlog/spdlog.h>

#define STREAMUP_LOG_DEBUG(fmt, ...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger_raw(),"{}:{} {}() ###: " fmt, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)
#define STREAMUP_LOG_DEBUG_0(fmt) SPDLOG_LOGGER_DEBUG(spdlog::default_logger_raw(),"{}:{} {}() !!!. " fmt,  __FILE__, __LINE__, __FUNCTION__)

#define STREAMUP_LOG_TRACE(fmt, ...) SPDLOG_LOGGER_TRACE(spdlog::default_logger_raw(),"{}:{} {}() ###: " fmt, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)

#define STREAMUP_LOG_INFO(fmt, ...) SPDLOG_LOGGER_INFO(spdlog::default_logger_raw(),"{}:{} {}() ###: " fmt, __FILE__, __LINE__, __FUNCTION__, __VA_ARGS__)
#define STREAMUP_LOG_INFO_0(fmt) SPDLOG_LOGGER_INFO(spdlog::default_logger_raw(),"{}:{} {}() !!!. " fmt,  __FILE__, __LINE__, __FUNCTION__)

#endif // STREAMUP_UTILS_LOGS_HPP
