#ifndef IFREADER_COMMON_LOGGING_H
#define IFREADER_COMMON_LOGGING_H

#include <spdlog/spdlog.h>

namespace ifreader::logger {
// Library logger "ifreader", created on first use (see utils/logger.cpp)
spdlog::logger *instance();
}  // namespace ifreader::logger

// Messages use fmt-style "{}" placeholders and carry the call site as
// source location.
#define IFREADER_INTERNAL_LOG(logger_level, ...)                         \
    ::ifreader::logger::instance()->log(                                 \
        spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION},         \
        logger_level, __VA_ARGS__)

#define IFREADER_LOG_TRACE(...) \
    IFREADER_INTERNAL_LOG(spdlog::level::trace, __VA_ARGS__)
#define IFREADER_LOG_DEBUG(...) \
    IFREADER_INTERNAL_LOG(spdlog::level::debug, __VA_ARGS__)
#define IFREADER_LOG_INFO(...) \
    IFREADER_INTERNAL_LOG(spdlog::level::info, __VA_ARGS__)
#define IFREADER_LOG_WARN(...) \
    IFREADER_INTERNAL_LOG(spdlog::level::warn, __VA_ARGS__)
#define IFREADER_LOG_ERROR(...) \
    IFREADER_INTERNAL_LOG(spdlog::level::err, __VA_ARGS__)

#endif  // IFREADER_COMMON_LOGGING_H
