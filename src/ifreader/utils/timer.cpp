#include <ifreader/utils/timer.h>

namespace ifreader {

Timer::Timer(const std::string& name)
    : name_(name), running_(true), start_time_(Clock::now()) {}

void Timer::stop() {
    if (running_) {
        end_time_ = Clock::now();
        running_ = false;
    }
}

double Timer::elapsed() const {
    Clock::time_point end = running_ ? Clock::now() : end_time_;
    return std::chrono::duration<double, std::milli>(end - start_time_)
        .count();
}

}  // namespace ifreader
