#pragma once

#include <chrono>

namespace shingle_eval {

/// Wall-clock stopwatch used to time the evaluation phases.
class Timer {
public:
    using clock = std::chrono::steady_clock;

    void start()
    {
        m_stopped = false;
        m_start = clock::now();
    }

    void stop()
    {
        m_stopped = true;
        m_end = clock::now();
    }

    /// Elapsed time in microseconds; measured up to now while running.
    double getElapsedTimeInMicroSec() const
    {
        const auto end = m_stopped ? m_end : clock::now();
        return std::chrono::duration<double, std::micro>(end - m_start).count();
    }

    double getElapsedTimeInMilliSec() const
    {
        return getElapsedTimeInMicroSec() * 1.0e-3;
    }

private:
    clock::time_point m_start = clock::now();
    clock::time_point m_end = m_start;
    bool m_stopped = false;
};

} // namespace shingle_eval
