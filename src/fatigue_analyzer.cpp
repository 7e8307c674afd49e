#include "../include/fatigue_analyzer.h"
#include "../include/constants.h"
#include "../include/cv_utils.h"
#include "../include/logger.h"
#include <algorithm>

namespace DeskMonitor
{
    namespace
    {
        constexpr double MILD_PERCLOS = 0.10;
        constexpr double LONG_CLOSURE_SECONDS = 1.0;
    }

    PerclosWindow::PerclosWindow(double window_seconds) : window_seconds_(window_seconds) {}

    void PerclosWindow::add(Timestamp end, bool closed, double duration)
    {
        if (duration <= 0.0)
            return;

        intervals_.push_back({end, closed, duration});
        covered_seconds_ += duration;
        if (closed)
            closed_seconds_ += duration;
    }

    void PerclosWindow::evict(Timestamp now)
    {
        Timestamp cutoff = addSeconds(now, -window_seconds_);

        while (!intervals_.empty() && intervals_.front().end <= cutoff)
        {
            const Interval &oldest = intervals_.front();
            covered_seconds_ -= oldest.duration;
            if (oldest.closed)
                closed_seconds_ -= oldest.duration;
            intervals_.pop_front();
        }

        // Trim the interval straddling the cutoff
        if (!intervals_.empty())
        {
            Interval &oldest = intervals_.front();
            double inside = secondsBetween(cutoff, oldest.end);
            if (inside < oldest.duration)
            {
                double trimmed = oldest.duration - inside;
                covered_seconds_ -= trimmed;
                if (oldest.closed)
                    closed_seconds_ -= trimmed;
                oldest.duration = inside;
            }
        }

        if (intervals_.empty())
        {
            covered_seconds_ = 0.0;
            closed_seconds_ = 0.0;
        }
        covered_seconds_ = std::max(0.0, covered_seconds_);
        closed_seconds_ = std::max(0.0, std::min(closed_seconds_, covered_seconds_));
    }

    void PerclosWindow::clear()
    {
        intervals_.clear();
        covered_seconds_ = 0.0;
        closed_seconds_ = 0.0;
    }

    double PerclosWindow::perclos() const
    {
        if (covered_seconds_ < Constants::EPSILON)
            return 0.0;
        return closed_seconds_ / covered_seconds_;
    }

    FatigueAnalyzer::FatigueAnalyzer(const Config &config)
        : config_(config), perclos_window_(config.perclos_window_seconds)
    {
    }

    FatigueSnapshot FatigueAnalyzer::update(const LandmarkSet &landmarks, Timestamp timestamp)
    {
        return update(landmarks, cv::Size(1, 1), timestamp);
    }

    FatigueSnapshot FatigueAnalyzer::update(const LandmarkSet &landmarks, const cv::Size &frame_size,
                                            Timestamp timestamp)
    {
        std::vector<cv::Point2f> left_eye = CVUtils::pixelPoints(landmarks, LandmarkIndices::LEFT_EYE, frame_size);
        std::vector<cv::Point2f> right_eye = CVUtils::pixelPoints(landmarks, LandmarkIndices::RIGHT_EYE, frame_size);

        // A collapsed eye width means the landmarks are unusable, not that the eye is closed
        if (CVUtils::euclidean(left_eye[0], left_eye[3]) < Constants::EPSILON ||
            CVUtils::euclidean(right_eye[0], right_eye[3]) < Constants::EPSILON)
        {
            Logger::debug("FatigueAnalyzer", "degenerate eye landmarks, frame discarded");
            gap_pending_ = true;
            return last_snapshot_;
        }

        FatigueSnapshot snapshot;
        snapshot.ear_left = CVUtils::calculateEAR(left_eye);
        snapshot.ear_right = CVUtils::calculateEAR(right_eye);
        snapshot.ear_avg = (snapshot.ear_left + snapshot.ear_right) / 2.0;

        bool is_closed = snapshot.ear_avg < config_.ear_threshold;

        creditInterval(timestamp);
        bool ended_in_microsleep = updateBlinkState(is_closed, timestamp);

        perclos_window_.evict(faceClock(timestamp));
        evictBlinks(faceClock(timestamp));

        last_frame_ = timestamp;
        has_last_frame_ = true;
        gap_pending_ = false;

        snapshot.is_blinking = (eye_state_ == EyeState::EYES_CLOSED);
        snapshot.blink_count_total = blink_count_total_;
        snapshot.microsleep_count = microsleep_count_;
        snapshot.closed_duration = snapshot.is_blinking ? closed_seconds_ : 0.0;
        snapshot.microsleep_active = ended_in_microsleep ||
                                     (snapshot.is_blinking && closed_seconds_ >= config_.microsleep_seconds);

        snapshot.perclos = perclos_window_.perclos();
        snapshot.perclos_valid = perclos_window_.coveredSeconds() >= config_.perclos_warmup_seconds;

        snapshot.blinks_per_minute = static_cast<double>(blink_times_.size()) *
                                     Constants::SECONDS_PER_MINUTE / config_.blink_window_seconds;
        snapshot.blink_rate_valid = observed_seconds_ >= config_.blink_window_seconds;
        snapshot.blink_rate_low = snapshot.blink_rate_valid && snapshot.blinks_per_minute < config_.blink_rate_low;
        snapshot.blink_rate_high = snapshot.blink_rate_valid && snapshot.blinks_per_minute > config_.blink_rate_high;

        snapshot.fatigue_level = computeFatigueLevel(snapshot);
        snapshot.valid = true;

        last_snapshot_ = snapshot;
        return snapshot;
    }

    FatigueSnapshot FatigueAnalyzer::markNoFace()
    {
        gap_pending_ = true;
        return last_snapshot_;
    }

    void FatigueAnalyzer::creditInterval(Timestamp now)
    {
        if (!has_last_frame_)
            return;

        double dt = std::max(0.0, secondsBetween(last_frame_, now));
        if (gap_pending_)
        {
            // Windows slide on face time, so an absence neither fills nor drains them
            gap_seconds_ += dt;
            return;
        }

        bool was_closed = (eye_state_ == EyeState::EYES_CLOSED);

        perclos_window_.add(faceClock(now), was_closed, dt);
        observed_seconds_ += dt;
        if (was_closed)
            closed_seconds_ += dt;
    }

    bool FatigueAnalyzer::updateBlinkState(bool is_closed, Timestamp now)
    {
        if (is_closed)
        {
            if (eye_state_ == EyeState::EYES_OPEN)
            {
                eye_state_ = EyeState::EYES_CLOSED;
                closed_seconds_ = 0.0;
            }
            return false;
        }

        if (eye_state_ == EyeState::EYES_OPEN)
            return false;

        eye_state_ = EyeState::EYES_OPEN;
        bool microsleep = closed_seconds_ >= config_.microsleep_seconds;
        if (microsleep)
        {
            microsleep_count_++;
            Logger::info("FatigueAnalyzer", "microsleep ended after " +
                                                CVUtils::formatDouble(closed_seconds_, 2) + "s");
        }
        else
        {
            blink_count_total_++;
            blink_times_.push_back(faceClock(now));
        }
        closed_seconds_ = 0.0;
        return microsleep;
    }

    void FatigueAnalyzer::evictBlinks(Timestamp now)
    {
        Timestamp cutoff = addSeconds(now, -config_.blink_window_seconds);
        while (!blink_times_.empty() && blink_times_.front() < cutoff)
            blink_times_.pop_front();
    }

    int FatigueAnalyzer::computeFatigueLevel(const FatigueSnapshot &snapshot) const
    {
        double perclos = snapshot.perclos_valid ? snapshot.perclos : 0.0;

        if (snapshot.microsleep_active || perclos > config_.perclos_severe_threshold)
            return 3;
        if (perclos > config_.perclos_threshold || snapshot.closed_duration > LONG_CLOSURE_SECONDS)
            return 2;
        if (perclos > MILD_PERCLOS || snapshot.blink_rate_low || snapshot.blink_rate_high)
            return 1;
        return 0;
    }

    void FatigueAnalyzer::reset()
    {
        perclos_window_.clear();
        blink_times_.clear();
        eye_state_ = EyeState::EYES_OPEN;
        closed_seconds_ = 0.0;
        observed_seconds_ = 0.0;
        blink_count_total_ = 0;
        microsleep_count_ = 0;
        has_last_frame_ = false;
        gap_pending_ = false;
        gap_seconds_ = 0.0;
        last_snapshot_ = FatigueSnapshot();
    }
}
