#include "test_helpers.h"
#include "../include/constants.h"
#include <opencv2/calib3d.hpp>
#include <cmath>
#include <stdexcept>

namespace DeskMonitor
{
    namespace Testing
    {
        Timestamp at(double seconds)
        {
            return addSeconds(Timestamp() + std::chrono::hours(1), seconds);
        }

        namespace
        {
            // p1..p6 with EAR = 2h / w
            void placeEye(LandmarkSet &landmarks, const int (&indices)[6], cv::Point2f center, float width, double ear)
            {
                float h = static_cast<float>(ear * width / 2.0);
                float third = width / 6.0f;
                landmarks.set(indices[0], cv::Point3f(center.x - width / 2.0f, center.y, 0.0f));
                landmarks.set(indices[1], cv::Point3f(center.x - third, center.y - h, 0.0f));
                landmarks.set(indices[2], cv::Point3f(center.x + third, center.y - h, 0.0f));
                landmarks.set(indices[3], cv::Point3f(center.x + width / 2.0f, center.y, 0.0f));
                landmarks.set(indices[4], cv::Point3f(center.x + third, center.y + h, 0.0f));
                landmarks.set(indices[5], cv::Point3f(center.x - third, center.y + h, 0.0f));
            }
        }

        LandmarkSet makeFace(const FaceGeometry &geometry)
        {
            LandmarkSet landmarks;
            const cv::Point2f c = geometry.center;

            placeEye(landmarks, LandmarkIndices::LEFT_EYE, cv::Point2f(c.x - geometry.eye_spacing / 2.0f, c.y),
                     geometry.eye_width, geometry.ear);
            placeEye(landmarks, LandmarkIndices::RIGHT_EYE, cv::Point2f(c.x + geometry.eye_spacing / 2.0f, c.y),
                     geometry.eye_width, geometry.ear);

            // Oval point 0 sits at angle 0 and point 18 at angle pi, so the extent is exactly face_width
            const int oval_count = static_cast<int>(sizeof(LandmarkIndices::FACE_OVAL) / sizeof(int));
            for (int i = 0; i < oval_count; ++i)
            {
                double angle = 2.0 * CV_PI * i / oval_count;
                float x = c.x + static_cast<float>(std::cos(angle)) * geometry.face_width / 2.0f;
                float y = c.y + 0.1f + static_cast<float>(std::sin(angle)) * geometry.face_width * 0.65f;
                landmarks.set(LandmarkIndices::FACE_OVAL[i], cv::Point3f(x, y, 0.0f));
            }

            float s = geometry.face_width;
            landmarks.set(LandmarkIndices::NOSE_TIP, cv::Point3f(c.x, c.y + 0.2f * s, 0.0f));
            landmarks.set(LandmarkIndices::CHIN, cv::Point3f(c.x, c.y + 0.7f * s, 0.0f));
            landmarks.set(LandmarkIndices::LEFT_MOUTH_CORNER, cv::Point3f(c.x - 0.15f * s, c.y + 0.45f * s, 0.0f));
            landmarks.set(LandmarkIndices::RIGHT_MOUTH_CORNER, cv::Point3f(c.x + 0.15f * s, c.y + 0.45f * s, 0.0f));
            return landmarks;
        }

        LandmarkSet makeFace(double ear)
        {
            FaceGeometry geometry;
            geometry.ear = ear;
            return makeFace(geometry);
        }

        LandmarkSet makeFaceAtDistance(double distance_cm, const Config &config, const cv::Size &frame_size)
        {
            FaceGeometry geometry;
            double face_px = config.known_face_width_cm * config.focal_length_px / distance_cm;
            double eye_px = config.known_eye_distance_cm * config.focal_length_px / distance_cm;
            geometry.face_width = static_cast<float>(face_px / frame_size.width);
            geometry.eye_spacing = static_cast<float>(eye_px / frame_size.width);
            geometry.eye_width = geometry.eye_spacing * 0.4f;
            return makeFace(geometry);
        }

        LandmarkSet makePosedFace(double pitch_deg, double yaw_deg, const cv::Size &frame_size, double focal_length_px)
        {
            const std::vector<cv::Point3f> model = {
                {0.0f, 0.0f, 0.0f},
                {0.0f, -330.0f, -65.0f},
                {-225.0f, 170.0f, -135.0f},
                {225.0f, 170.0f, -135.0f},
                {-150.0f, -150.0f, -125.0f},
                {150.0f, -150.0f, -125.0f}};

            double p = pitch_deg * CV_PI / 180.0;
            double y = yaw_deg * CV_PI / 180.0;
            cv::Mat rx = (cv::Mat_<double>(3, 3) << 1, 0, 0, 0, std::cos(p), -std::sin(p), 0, std::sin(p), std::cos(p));
            cv::Mat ry = (cv::Mat_<double>(3, 3) << std::cos(y), 0, std::sin(y), 0, 1, 0, -std::sin(y), 0, std::cos(y));
            cv::Mat flip = (cv::Mat_<double>(3, 3) << 1, 0, 0, 0, -1, 0, 0, 0, -1);
            cv::Mat rotation = rx * ry * flip;

            cv::Mat rvec;
            cv::Rodrigues(rotation, rvec);
            cv::Mat tvec = (cv::Mat_<double>(3, 1) << 0.0, 0.0, 3000.0);
            cv::Mat camera = (cv::Mat_<double>(3, 3) << focal_length_px, 0, frame_size.width / 2.0,
                              0, focal_length_px, frame_size.height / 2.0,
                              0, 0, 1);

            std::vector<cv::Point2f> projected;
            cv::projectPoints(model, rvec, tvec, camera, cv::Mat::zeros(4, 1, CV_64FC1), projected);

            LandmarkSet landmarks;
            for (size_t i = 0; i < projected.size(); ++i)
            {
                landmarks.set(LandmarkIndices::POSE_POINTS[i],
                              cv::Point3f(projected[i].x / frame_size.width, projected[i].y / frame_size.height, 0.0f));
            }
            return landmarks;
        }

        Config quietConfig()
        {
            Config config;
            config.enable_console_logging = false;
            config.enable_file_logging = false;
            config.enable_console_alert = false;
            config.show_window = false;
            return config;
        }

        bool ThrowingNotifier::notify(const AlertPayload &)
        {
            calls++;
            throw std::runtime_error("channel exploded");
        }
    }
}
