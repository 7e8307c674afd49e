#include "../include/distance_estimator.h"
#include "../include/constants.h"
#include "../include/cv_utils.h"
#include "../include/logger.h"

namespace DeskMonitor
{
    namespace
    {
        constexpr double TOO_CLOSE_FACTOR = 0.7;
        constexpr double FAR_FACTOR = 1.5;
    }

    DistanceEstimator::DistanceEstimator(const Config &config) : config_(config) {}

    DistanceSnapshot DistanceEstimator::update(const LandmarkSet &landmarks, int frame_width, int frame_height,
                                               Timestamp timestamp)
    {
        cv::Size frame_size(frame_width, frame_height);

        double bbox_width_px = CVUtils::horizontalExtent(
            CVUtils::pixelPoints(landmarks, LandmarkIndices::FACE_OVAL, frame_size));

        cv::Point2f left_center = CVUtils::centroid(CVUtils::pixelPoints(landmarks, LandmarkIndices::LEFT_EYE, frame_size));
        cv::Point2f right_center = CVUtils::centroid(CVUtils::pixelPoints(landmarks, LandmarkIndices::RIGHT_EYE, frame_size));
        double eye_px = CVUtils::euclidean(left_center, right_center);

        bool bbox_usable = bbox_width_px > Constants::EPSILON;
        bool eye_usable = eye_px > Constants::EPSILON;

        if (!bbox_usable && !eye_usable)
        {
            Logger::debug("DistanceEstimator", "degenerate face geometry, frame discarded");
            return last_snapshot_;
        }

        DistanceSnapshot snapshot;
        if (bbox_usable)
            snapshot.raw_bbox_estimate = config_.known_face_width_cm * config_.focal_length_px / bbox_width_px;
        if (eye_usable)
            snapshot.raw_eye_estimate = config_.known_eye_distance_cm * config_.focal_length_px / eye_px;

        double raw;
        if (bbox_usable && eye_usable)
            raw = config_.eye_method_weight * snapshot.raw_eye_estimate +
                  (1.0 - config_.eye_method_weight) * snapshot.raw_bbox_estimate;
        else
            raw = bbox_usable ? snapshot.raw_bbox_estimate : snapshot.raw_eye_estimate;

        if (!has_estimate_)
        {
            smoothed_distance_ = raw;
            has_estimate_ = true;
        }
        else
        {
            smoothed_distance_ += config_.distance_smoothing_alpha * (raw - smoothed_distance_);
        }

        snapshot.smoothed_distance = smoothed_distance_;
        snapshot.sustained_seconds = too_close_timer_.update(smoothed_distance_ < config_.warning_distance_cm, timestamp);
        snapshot.is_too_close = too_close_timer_.hasReached(config_.distance_sustain_seconds);
        snapshot.zone = classifyZone(smoothed_distance_);
        snapshot.valid = true;

        last_snapshot_ = snapshot;
        return snapshot;
    }

    DistanceSnapshot DistanceEstimator::markNoFace()
    {
        too_close_timer_.pause();
        return last_snapshot_;
    }

    void DistanceEstimator::reset()
    {
        too_close_timer_.reset();
        has_estimate_ = false;
        smoothed_distance_ = 0.0;
        last_snapshot_ = DistanceSnapshot();
    }

    DistanceZone DistanceEstimator::classifyZone(double distance_cm) const
    {
        if (distance_cm < TOO_CLOSE_FACTOR * config_.warning_distance_cm)
            return DistanceZone::TOO_CLOSE;
        if (distance_cm < config_.warning_distance_cm)
            return DistanceZone::CLOSE;
        if (distance_cm < FAR_FACTOR * config_.warning_distance_cm)
            return DistanceZone::NORMAL;
        return DistanceZone::FAR;
    }

    double DistanceEstimator::calibrateFocalLength(double measured_distance_cm, double bbox_width_px,
                                                   double known_face_width_cm)
    {
        if (measured_distance_cm <= 0.0 || bbox_width_px <= 0.0 || known_face_width_cm <= 0.0)
            return 0.0;
        return bbox_width_px * measured_distance_cm / known_face_width_cm;
    }

    std::string DistanceEstimator::zoneToString(DistanceZone zone)
    {
        switch (zone)
        {
        case DistanceZone::TOO_CLOSE:
            return "TOO_CLOSE";
        case DistanceZone::CLOSE:
            return "CLOSE";
        case DistanceZone::NORMAL:
            return "NORMAL";
        case DistanceZone::FAR:
            return "FAR";
        default:
            return "UNKNOWN";
        }
    }
}
