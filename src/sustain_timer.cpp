#include "../include/sustain_timer.h"
#include <algorithm>

namespace DeskMonitor
{
    double SustainTimer::update(bool condition, Timestamp now)
    {
        if (condition)
        {
            if (!active_)
            {
                active_ = true;
                accumulated_seconds_ = 0.0;
            }
            else if (!paused_ && has_last_update_)
            {
                accumulated_seconds_ += std::max(0.0, secondsBetween(last_update_, now));
            }
        }
        else
        {
            active_ = false;
            accumulated_seconds_ = 0.0;
        }

        last_update_ = now;
        has_last_update_ = true;
        paused_ = false;
        return sustainedSeconds();
    }

    void SustainTimer::pause()
    {
        paused_ = true;
    }

    void SustainTimer::reset()
    {
        accumulated_seconds_ = 0.0;
        active_ = false;
        paused_ = false;
        has_last_update_ = false;
    }
}
