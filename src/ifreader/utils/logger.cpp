#include <ifreader/common/logging.h>
#include <ifreader/utils/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>

namespace ifreader::logger {

static bool parse_level(const std::string &level_str,
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

static std::shared_ptr<spdlog::logger> create_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    logger->set_pattern(DEFAULT_PATTERN);

    spdlog::level::level_enum level = spdlog::level::warn;
    const char *env_level = std::getenv(LEVEL_ENV_VAR);
    if (env_level && !parse_level(env_level, level)) {
        logger->warn("Ignoring {}={}: not a log level", LEVEL_ENV_VAR,
                     env_level);
    }
    logger->set_level(level);
    return logger;
}

spdlog::logger *instance() {
    static std::shared_ptr<spdlog::logger> logger = create_logger();
    return logger.get();
}

int set_log_level(const std::string &level_str) {
    spdlog::level::level_enum level;
    if (!parse_level(level_str, level)) {
        return -1;
    }
    instance()->set_level(level);
    return 0;
}

int set_log_level_int(int level) {
    if (level < spdlog::level::trace || level >= spdlog::level::n_levels) {
        return -1;
    }
    instance()->set_level(static_cast<spdlog::level::level_enum>(level));
    return 0;
}

std::string get_log_level_string() {
    auto name = spdlog::level::to_string_view(instance()->level());
    return std::string(name.data(), name.size());
}

int get_log_level_int() { return static_cast<int>(instance()->level()); }

void set_log_pattern(const std::string &pattern) {
    instance()->set_pattern(pattern);
}

}  // namespace ifreader::logger

extern "C" {

int ifr_set_log_level(const char *level_str) {
    if (!level_str) {
        return -1;
    }
    return ifreader::logger::set_log_level(level_str);
}

int ifr_set_log_level_int(int level) {
    return ifreader::logger::set_log_level_int(level);
}

const char *ifr_get_log_level_string(void) {
    static thread_local std::string level_string;
    level_string = ifreader::logger::get_log_level_string();
    return level_string.c_str();
}

int ifr_get_log_level_int(void) {
    return ifreader::logger::get_log_level_int();
}

int ifr_set_log_pattern(const char *pattern) {
    if (!pattern) {
        return -1;
    }
    ifreader::logger::set_log_pattern(pattern);
    return 0;
}

}  // extern "C"
