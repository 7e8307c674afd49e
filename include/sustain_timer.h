#ifndef SUSTAIN_TIMER_H
#define SUSTAIN_TIMER_H

#include "timestamp.h"

namespace DeskMonitor
{
    /**
     * @brief Accumulates how long a condition has held continuously.
     *
     * Time is credited between consecutive observations in which the condition
     * holds. A false observation resets to zero. pause() marks a gap (no face):
     * the interval spanning the gap is not credited, but the total is kept.
     */
    class SustainTimer
    {
    private:
        double accumulated_seconds_ = 0.0;
        bool active_ = false;
        bool paused_ = false;
        bool has_last_update_ = false;
        Timestamp last_update_;

    public:
        double update(bool condition, Timestamp now);
        void pause();
        void reset();

        double sustainedSeconds() const { return active_ ? accumulated_seconds_ : 0.0; }
        bool isActive() const { return active_; }
        bool hasReached(double seconds) const { return active_ && accumulated_seconds_ >= seconds; }
    };
}

#endif // SUSTAIN_TIMER_H
