#ifndef TIMESTAMP_H
#define TIMESTAMP_H

#include <chrono>

namespace DeskMonitor
{
    using Clock = std::chrono::steady_clock;
    using Timestamp = Clock::time_point;

    inline double secondsBetween(Timestamp from, Timestamp to)
    {
        return std::chrono::duration<double>(to - from).count();
    }

    inline Timestamp addSeconds(Timestamp t, double seconds)
    {
        return t + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
    }
}

#endif // TIMESTAMP_H
