#include "utils/timer.hpp"

namespace utils {

Timer::Timer()
    : start_time_(std::chrono::steady_clock::now()),
      end_time_(start_time_),
      running_(false) {
}

void Timer::start() {
    start_time_ = std::chrono::steady_clock::now();
    running_ = true;
}

void Timer::stop() {
    if (running_) {
        end_time_ = std::chrono::steady_clock::now();
        running_ = false;
    }
}

double Timer::get_elapsed_ms() const {
    auto end = running_ ? std::chrono::steady_clock::now() : end_time_;
    return std::chrono::duration<double, std::milli>(end - start_time_).count();
}

double Timer::get_elapsed_seconds() const {
    return get_elapsed_ms() / 1000.0;
}

} // namespace utils
