#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ipod::timing {

// Wall-clock stopwatch, seconds
class SimpleTimer {
public:
    void start() { m_start = std::chrono::steady_clock::now(); }

    [[nodiscard]] double stop() const {
        const std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - m_start;
        return elapsed.count();
    }

private:
    std::chrono::steady_clock::time_point m_start{
        std::chrono::steady_clock::now()};
};

// Debug-logs the time spent between construction and destruction
class ScopeTimer {
public:
    explicit ScopeTimer(std::string_view label) : m_label(label) {}

    ~ScopeTimer() {
        spdlog::debug("{} took {:.3f} seconds", m_label, m_timer.stop());
    }

    ScopeTimer(const ScopeTimer&)            = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&)                 = delete;
    ScopeTimer& operator=(ScopeTimer&&)      = delete;

private:
    std::string m_label;
    SimpleTimer m_timer;
};

} // namespace ipod::timing
