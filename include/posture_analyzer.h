#ifndef POSTURE_ANALYZER_H
#define POSTURE_ANALYZER_H

#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "config.h"
#include "landmark_set.h"
#include "sustain_timer.h"
#include "timestamp.h"

namespace DeskMonitor
{
    enum class PostureState
    {
        NORMAL,
        HEAD_DOWN,
        HEAD_UP,
        UNKNOWN
    };

    struct CameraIntrinsics
    {
        double focal_length_px = 0.0;
        cv::Point2d principal_point;

        // Principal point at the image center
        static CameraIntrinsics fromFrame(const cv::Size &frame_size, double focal_length_px);
    };

    struct PostureSnapshot
    {
        double pitch = 0.0; // X-axis rotation, positive = head down
        double yaw = 0.0;   // Y-axis rotation
        double roll = 0.0;  // Z-axis rotation
        PostureState posture_state = PostureState::UNKNOWN;
        double sustained_seconds = 0.0;
        bool is_sustained = false;
        bool valid = false;
        int consecutive_failures = 0;
    };

    class PostureAnalyzer
    {
    private:
        Config config_;

        // 3D model points for facial landmarks (in mm, relative to nose tip)
        std::vector<cv::Point3f> model_points_;
        cv::Mat dist_coeffs_;

        SustainTimer head_down_timer_;
        SustainTimer head_up_timer_;
        int consecutive_failures_ = 0;
        PostureSnapshot last_snapshot_;

        void initializeModelPoints();
        bool solveAngles(const std::vector<cv::Point2f> &image_points, const CameraIntrinsics &intrinsics,
                         double &pitch, double &yaw, double &roll) const;
        PostureState classifyPosture(double pitch) const;
        PostureSnapshot handleFailure(const std::string &reason);

    public:
        explicit PostureAnalyzer(const Config &config);

        PostureSnapshot update(const LandmarkSet &landmarks, const cv::Size &frame_size,
                               const CameraIntrinsics &intrinsics, Timestamp timestamp);

        // Pauses both sustain timers and returns the last snapshot
        PostureSnapshot markNoFace();

        void reset();

        const PostureSnapshot &lastSnapshot() const { return last_snapshot_; }
        const std::vector<cv::Point3f> &modelPoints() const { return model_points_; }

        static std::string postureStateToString(PostureState state);
    };
}

#endif // POSTURE_ANALYZER_H
