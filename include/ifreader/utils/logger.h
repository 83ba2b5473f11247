#ifndef IFREADER_UTILS_LOGGER_H
#define IFREADER_UTILS_LOGGER_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Set the level of the ifreader logger
 * @param level_str "trace", "debug", "info", "warn"/"warning",
 *                  "err"/"error", "critical" or "off" (case insensitive)
 * @return 0 on success, -1 if level_str is NULL or not a level name
 */
int ifr_set_log_level(const char *level_str);

/**
 * Set the level of the ifreader logger from spdlog's numbering
 * (0 = trace ... 6 = off)
 * @return 0 on success, -1 if level is out of range
 */
int ifr_set_log_level_int(int level);

/**
 * @return current level name (pointer to thread-local storage, valid until
 *         the next call on the same thread)
 */
const char *ifr_get_log_level_string(void);
int ifr_get_log_level_int(void);

/**
 * Set the spdlog pattern of the ifreader logger
 * @return 0 on success, -1 if pattern is NULL
 */
int ifr_set_log_pattern(const char *pattern);

#ifdef __cplusplus
}  // extern "C"

#include <string>

namespace ifreader::logger {

// Name of the library logger; it is not registered with spdlog's registry
static constexpr const char *LOGGER_NAME = "ifreader";
// Initial level override, read once when the logger is created
static constexpr const char *LEVEL_ENV_VAR = "IFREADER_LOG_LEVEL";
static constexpr const char *DEFAULT_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v [%s:%#]";

int set_log_level(const std::string &level_str);
int set_log_level_int(int level);
std::string get_log_level_string();
int get_log_level_int();
void set_log_pattern(const std::string &pattern);

}  // namespace ifreader::logger
#endif

#endif  // IFREADER_UTILS_LOGGER_H
