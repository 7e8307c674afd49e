#include "../include/posture_analyzer.h"
#include "../include/constants.h"
#include "../include/cv_utils.h"
#include "../include/logger.h"
#include <opencv2/calib3d.hpp>
#include <algorithm>
#include <cmath>

namespace DeskMonitor
{
    namespace
    {
        constexpr double RAD2DEG = 180.0 / CV_PI;
        constexpr double GIMBAL_LOCK_COS = 1e-3;
    }

    CameraIntrinsics CameraIntrinsics::fromFrame(const cv::Size &frame_size, double focal_length_px)
    {
        CameraIntrinsics intrinsics;
        intrinsics.focal_length_px = focal_length_px;
        intrinsics.principal_point = cv::Point2d(frame_size.width / 2.0, frame_size.height / 2.0);
        return intrinsics;
    }

    PostureAnalyzer::PostureAnalyzer(const Config &config) : config_(config)
    {
        dist_coeffs_ = cv::Mat::zeros(4, 1, CV_64FC1); // Assume no lens distortion
        initializeModelPoints();
    }

    void PostureAnalyzer::initializeModelPoints()
    {
        // Same order as LandmarkIndices::POSE_POINTS. Model frame: y up, z toward the viewer
        model_points_.clear();
        model_points_.reserve(6);
        model_points_.push_back(cv::Point3f(0.0f, 0.0f, 0.0f));          // Nose tip
        model_points_.push_back(cv::Point3f(0.0f, -330.0f, -65.0f));     // Chin
        model_points_.push_back(cv::Point3f(-225.0f, 170.0f, -135.0f));  // Left eye outer corner
        model_points_.push_back(cv::Point3f(225.0f, 170.0f, -135.0f));   // Right eye outer corner
        model_points_.push_back(cv::Point3f(-150.0f, -150.0f, -125.0f)); // Left mouth corner
        model_points_.push_back(cv::Point3f(150.0f, -150.0f, -125.0f));  // Right mouth corner
    }

    PostureSnapshot PostureAnalyzer::update(const LandmarkSet &landmarks, const cv::Size &frame_size,
                                            const CameraIntrinsics &intrinsics, Timestamp timestamp)
    {
        std::vector<cv::Point2f> image_points = CVUtils::pixelPoints(landmarks, LandmarkIndices::POSE_POINTS, frame_size);

        // Eye corners or nose-to-chin collapsed: no usable geometry
        if (CVUtils::euclidean(image_points[2], image_points[3]) < Constants::EPSILON ||
            CVUtils::euclidean(image_points[0], image_points[1]) < Constants::EPSILON)
        {
            return handleFailure("degenerate image points");
        }

        double pitch = 0.0, yaw = 0.0, roll = 0.0;
        try
        {
            if (!solveAngles(image_points, intrinsics, pitch, yaw, roll))
                return handleFailure("pose solve rejected");
        }
        catch (const cv::Exception &e)
        {
            return handleFailure(std::string("pose solve threw: ") + e.what());
        }

        consecutive_failures_ = 0;

        PostureSnapshot snapshot;
        snapshot.pitch = pitch;
        snapshot.yaw = yaw;
        snapshot.roll = roll;
        snapshot.posture_state = classifyPosture(pitch);

        head_down_timer_.update(snapshot.posture_state == PostureState::HEAD_DOWN, timestamp);
        head_up_timer_.update(snapshot.posture_state == PostureState::HEAD_UP, timestamp);

        if (snapshot.posture_state == PostureState::HEAD_DOWN)
        {
            snapshot.sustained_seconds = head_down_timer_.sustainedSeconds();
            snapshot.is_sustained = head_down_timer_.hasReached(config_.posture_sustain_seconds);
        }
        else if (snapshot.posture_state == PostureState::HEAD_UP)
        {
            snapshot.sustained_seconds = head_up_timer_.sustainedSeconds();
            snapshot.is_sustained = head_up_timer_.hasReached(config_.posture_sustain_seconds);
        }

        snapshot.valid = true;
        snapshot.consecutive_failures = 0;
        last_snapshot_ = snapshot;
        return snapshot;
    }

    bool PostureAnalyzer::solveAngles(const std::vector<cv::Point2f> &image_points, const CameraIntrinsics &intrinsics,
                                      double &pitch, double &yaw, double &roll) const
    {
        cv::Mat camera_matrix = (cv::Mat_<double>(3, 3) << intrinsics.focal_length_px, 0, intrinsics.principal_point.x,
                                 0, intrinsics.focal_length_px, intrinsics.principal_point.y,
                                 0, 0, 1);

        // Solve PnP to get rotation and translation vectors
        cv::Mat rotation_vector, translation_vector;
        bool success = cv::solvePnP(model_points_, image_points, camera_matrix, dist_coeffs_,
                                    rotation_vector, translation_vector, false, cv::SOLVEPNP_ITERATIVE);
        if (!success)
            return false;

        // Face must be in front of the camera
        double depth = translation_vector.at<double>(2, 0);
        if (!std::isfinite(depth) || depth <= 0.0)
            return false;

        cv::Mat rotation_matrix;
        cv::Rodrigues(rotation_vector, rotation_matrix);

        // Undo the fixed 180 degree turn about x between model and camera frames
        cv::Mat flip = (cv::Mat_<double>(3, 3) << 1, 0, 0, 0, -1, 0, 0, 0, -1);
        cv::Mat head = rotation_matrix * flip;

        // head = Rx(pitch) * Ry(yaw) * Rz(roll)
        double sin_yaw = head.at<double>(0, 2);
        if (!std::isfinite(sin_yaw))
            return false;
        sin_yaw = std::max(-1.0, std::min(1.0, sin_yaw));
        if (std::sqrt(1.0 - sin_yaw * sin_yaw) < GIMBAL_LOCK_COS)
            return false;

        yaw = std::asin(sin_yaw) * RAD2DEG;
        pitch = std::atan2(-head.at<double>(1, 2), head.at<double>(2, 2)) * RAD2DEG;
        roll = std::atan2(-head.at<double>(0, 1), head.at<double>(0, 0)) * RAD2DEG;

        return std::isfinite(pitch) && std::isfinite(yaw) && std::isfinite(roll);
    }

    PostureState PostureAnalyzer::classifyPosture(double pitch) const
    {
        if (pitch > config_.pitch_threshold_down)
            return PostureState::HEAD_DOWN;
        if (pitch < config_.pitch_threshold_up)
            return PostureState::HEAD_UP;
        return PostureState::NORMAL;
    }

    PostureSnapshot PostureAnalyzer::handleFailure(const std::string &reason)
    {
        consecutive_failures_++;
        Logger::debug("PostureAnalyzer", reason + " (" + std::to_string(consecutive_failures_) + " in a row)");

        if (consecutive_failures_ >= config_.posture_max_failed_frames)
        {
            if (consecutive_failures_ == config_.posture_max_failed_frames)
                Logger::warn("PostureAnalyzer", "pose lost, sustain timers reset");
            head_down_timer_.reset();
            head_up_timer_.reset();
            last_snapshot_ = PostureSnapshot();
        }

        PostureSnapshot snapshot = last_snapshot_;
        snapshot.consecutive_failures = consecutive_failures_;
        return snapshot;
    }

    PostureSnapshot PostureAnalyzer::markNoFace()
    {
        head_down_timer_.pause();
        head_up_timer_.pause();
        return last_snapshot_;
    }

    void PostureAnalyzer::reset()
    {
        head_down_timer_.reset();
        head_up_timer_.reset();
        consecutive_failures_ = 0;
        last_snapshot_ = PostureSnapshot();
    }

    std::string PostureAnalyzer::postureStateToString(PostureState state)
    {
        switch (state)
        {
        case PostureState::NORMAL:
            return "NORMAL";
        case PostureState::HEAD_DOWN:
            return "HEAD_DOWN";
        case PostureState::HEAD_UP:
            return "HEAD_UP";
        case PostureState::UNKNOWN:
        default:
            return "UNKNOWN";
        }
    }
}
