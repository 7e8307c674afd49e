#ifndef FATIGUE_ANALYZER_H
#define FATIGUE_ANALYZER_H

#include <cstddef>
#include <deque>
#include <opencv2/core.hpp>
#include "config.h"
#include "landmark_set.h"
#include "timestamp.h"

namespace DeskMonitor
{
    enum class EyeState
    {
        EYES_OPEN,
        EYES_CLOSED
    };

    struct FatigueSnapshot
    {
        double ear_left = 0.0;
        double ear_right = 0.0;
        double ear_avg = 0.0;
        bool is_blinking = false; // eyes currently classified closed
        int blink_count_total = 0;
        double perclos = 0.0;
        bool perclos_valid = false;
        bool microsleep_active = false;
        int microsleep_count = 0;
        double closed_duration = 0.0; // length of the current closure
        double blinks_per_minute = 0.0;
        bool blink_rate_valid = false;
        bool blink_rate_low = false;
        bool blink_rate_high = false;
        int fatigue_level = 0; // 0 normal .. 3 severe
        bool valid = false;
    };

    /**
     * @brief Trailing time window of open/closed intervals.
     *
     * Each interval is the time between two face frames, credited to the eye
     * state held during it. Eviction is by timestamp, so the result does not
     * depend on frame rate. FatigueAnalyzer passes face-clock timestamps, which
     * leave out the time no face was seen.
     */
    class PerclosWindow
    {
    private:
        struct Interval
        {
            Timestamp end;
            bool closed;
            double duration;
        };

        std::deque<Interval> intervals_;
        double window_seconds_;
        double closed_seconds_ = 0.0;
        double covered_seconds_ = 0.0;

    public:
        explicit PerclosWindow(double window_seconds);

        void add(Timestamp end, bool closed, double duration);
        void evict(Timestamp now);
        void clear();

        double perclos() const;
        double coveredSeconds() const { return covered_seconds_; }
        double closedSeconds() const { return closed_seconds_; }
        std::size_t size() const { return intervals_.size(); }
    };

    class FatigueAnalyzer
    {
    private:
        Config config_;
        PerclosWindow perclos_window_;
        std::deque<Timestamp> blink_times_;

        EyeState eye_state_ = EyeState::EYES_OPEN;
        double closed_seconds_ = 0.0;
        double observed_seconds_ = 0.0;
        int blink_count_total_ = 0;
        int microsleep_count_ = 0;

        bool has_last_frame_ = false;
        bool gap_pending_ = false;
        Timestamp last_frame_;
        double gap_seconds_ = 0.0; // total time without a usable face, removed from the face clock

        FatigueSnapshot last_snapshot_;

        Timestamp faceClock(Timestamp now) const { return addSeconds(now, -gap_seconds_); }
        void creditInterval(Timestamp now);
        bool updateBlinkState(bool is_closed, Timestamp now);
        void evictBlinks(Timestamp now);
        int computeFatigueLevel(const FatigueSnapshot &snapshot) const;

    public:
        explicit FatigueAnalyzer(const Config &config);

        FatigueSnapshot update(const LandmarkSet &landmarks, const cv::Size &frame_size, Timestamp timestamp);

        // Treats landmark coordinates as isotropic
        FatigueSnapshot update(const LandmarkSet &landmarks, Timestamp timestamp);

        // No face this frame: nothing is sampled and the gap is not credited
        FatigueSnapshot markNoFace();

        void reset();

        const FatigueSnapshot &lastSnapshot() const { return last_snapshot_; }
        EyeState eyeState() const { return eye_state_; }
        const PerclosWindow &perclosWindow() const { return perclos_window_; }
    };
}

#endif // FATIGUE_ANALYZER_H
