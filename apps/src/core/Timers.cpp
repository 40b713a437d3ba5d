#include "Timers.h"

#include <algorithm>
#include <spdlog/fmt/fmt.h>

void Timers::startTimer(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = entries_[name];
    entry.started = Clock::now();
    entry.running = true;
}

double Timers::stopTimer(const std::string& name)
{
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end() || !it->second.running) {
        return 0.0;
    }

    Entry& entry = it->second;
    const double elapsed =
        std::chrono::duration<double, std::milli>(now - entry.started).count();
    entry.accumulated_ms += elapsed;
    entry.calls++;
    entry.running = false;
    return elapsed;
}

double Timers::getAccumulatedTime(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    return it == entries_.end() ? 0.0 : it->second.accumulated_ms;
}

unsigned Timers::getCallCount(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    return it == entries_.end() ? 0 : it->second.calls;
}

double Timers::getAverageTime(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second.calls == 0) {
        return 0.0;
    }
    return it->second.accumulated_ms / it->second.calls;
}

bool Timers::hasTimer(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(name);
}

std::vector<std::string> Timers::getAllTimerNames() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void Timers::resetAll()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::string Timers::summary() const
{
    std::string out;
    for (const auto& name : getAllTimerNames()) {
        const unsigned calls = getCallCount(name);
        out += fmt::format(
            "{}: {:.3f} ms ({} calls, {:.3f} ms avg)\n",
            name,
            getAccumulatedTime(name),
            calls,
            getAverageTime(name));
    }
    return out;
}
