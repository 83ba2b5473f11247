#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <ifreader/utils/logger.h>
#include <ifreader/utils/timer.h>
#include <stdlib.h>

#include <chrono>
#include <string>
#include <thread>

using namespace ifreader;

// Must stay the first test case: the logger reads the environment only
// when it is created
TEST_CASE("Logger - Level from the environment") {
    REQUIRE(setenv(logger::LEVEL_ENV_VAR, "Debug", 1) == 0);
    CHECK(logger::get_log_level_string() == "debug");
    unsetenv(logger::LEVEL_ENV_VAR);
}

TEST_CASE("Logger - Levels by name and number") {
    CHECK(logger::set_log_level("critical") == 0);
    CHECK(logger::get_log_level_string() == "critical");
    CHECK(logger::get_log_level_int() == 5);

    CHECK(logger::set_log_level("err") == 0);
    CHECK(logger::get_log_level_string() == "error");

    CHECK(logger::set_log_level("") == -1);
    CHECK(logger::set_log_level("loud") == -1);
    CHECK(logger::get_log_level_string() == "error");

    CHECK(logger::set_log_level_int(2) == 0);
    CHECK(logger::get_log_level_string() == "info");
    CHECK(logger::set_log_level_int(7) == -1);
    CHECK(logger::get_log_level_int() == 2);

    logger::set_log_pattern(logger::DEFAULT_PATTERN);
    CHECK(logger::set_log_level("warning") == 0);
}

TEST_CASE("Timer - Measures a named phase") {
    Timer timer("phase");
    CHECK(timer.name() == "phase");

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    double running = timer.elapsed();
    CHECK(running >= 5.0);

    timer.stop();
    double stopped = timer.elapsed();
    CHECK(stopped >= running);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    CHECK(timer.elapsed() == stopped);

    // A second stop keeps the first end time
    timer.stop();
    CHECK(timer.elapsed() == stopped);
}
