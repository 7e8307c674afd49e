#ifndef CV_UTILS_H
#define CV_UTILS_H

#include <vector>
#include <string>
#include <opencv2/core.hpp>
#include "alert_types.h"
#include "config.h"
#include "landmark_set.h"

namespace DeskMonitor
{
    namespace CVUtils
    {
        double euclidean(const cv::Point2f &a, const cv::Point2f &b);

        // (|p2-p6| + |p3-p5|) / (2 |p1-p4|); 0 when the eye has no width
        double calculateEAR(const std::vector<cv::Point2f> &eye_points);

        cv::Point2f centroid(const std::vector<cv::Point2f> &points);

        // max(x) - min(x); 0 for an empty set
        double horizontalExtent(const std::vector<cv::Point2f> &points);

        template <std::size_t N>
        std::vector<cv::Point2f> pixelPoints(const LandmarkSet &landmarks, const int (&indices)[N],
                                             const cv::Size &frame_size)
        {
            std::vector<cv::Point2f> points;
            points.reserve(N);
            for (int index : indices)
                points.push_back(landmarks.pixel(index, frame_size));
            return points;
        }

        cv::Scalar getSeverityColor(Severity severity, const Config &config);
        std::string formatDouble(double value, int precision = 3);
    }
}

#endif // CV_UTILS_H
