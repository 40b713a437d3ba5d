#pragma once

#include "Timers.h"
#include <string>
#include <utility>

// Starts the named timer on construction and stops it when the scope ends.
class ScopeTimer {
public:
    ScopeTimer(Timers& timers, std::string name) : timers_(timers), name_(std::move(name))
    {
        timers_.startTimer(name_);
    }

    ~ScopeTimer() { timers_.stopTimer(name_); }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    Timers& timers_;
    std::string name_;
};
