#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Named wall-clock stopwatches that accumulate total time and call count.
 *
 * Thread-safe: stages timed from inside parallel regions may share one instance.
 * Use ScopeTimer for RAII start/stop.
 */
class Timers {
public:
    void startTimer(const std::string& name);

    // Returns the elapsed milliseconds of this run, or 0 if the timer was not running.
    double stopTimer(const std::string& name);

    double getAccumulatedTime(const std::string& name) const;
    unsigned getCallCount(const std::string& name) const;
    double getAverageTime(const std::string& name) const;
    bool hasTimer(const std::string& name) const;

    std::vector<std::string> getAllTimerNames() const;
    void resetAll();

    // One line per timer, sorted by name: "name: total ms (count calls, avg ms)".
    std::string summary() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Clock::time_point started{};
        bool running = false;
        double accumulated_ms = 0.0;
        unsigned calls = 0;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};
