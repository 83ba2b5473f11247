#ifndef IFREADER_UTILS_TIMER_H
#define IFREADER_UTILS_TIMER_H

#include <chrono>
#include <string>

namespace ifreader {

// Wall-clock stopwatch for a named phase; starts on construction
class Timer {
   public:
    explicit Timer(const std::string& name);

    void stop();

    // Milliseconds between construction and stop(), or until now while the
    // timer is still running
    double elapsed() const;

    const std::string& name() const { return name_; }

   private:
    using Clock = std::chrono::steady_clock;

    std::string name_;
    bool running_;
    Clock::time_point start_time_;
    Clock::time_point end_time_;
};

}  // namespace ifreader

#endif  // IFREADER_UTILS_TIMER_H
