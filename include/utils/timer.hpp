#pragma once

#include <chrono>

namespace utils {

class Timer {
public:
    Timer();
    ~Timer() = default;

    void start();
    void stop();

    // While running, measured up to now
    double get_elapsed_ms() const;
    double get_elapsed_seconds() const;
    bool is_running() const noexcept { return running_; }

private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
    bool running_;
};

} // namespace utils
