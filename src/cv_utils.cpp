#include "../include/cv_utils.h"
#include "../include/constants.h"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace DeskMonitor
{
    namespace CVUtils
    {
        double euclidean(const cv::Point2f &a, const cv::Point2f &b)
        {
            return cv::norm(a - b);
        }

        double calculateEAR(const std::vector<cv::Point2f> &eye_points)
        {
            if (eye_points.size() != 6)
                return 0.0;

            double vertical1 = euclidean(eye_points[1], eye_points[5]);
            double vertical2 = euclidean(eye_points[2], eye_points[4]);
            double horizontal = euclidean(eye_points[0], eye_points[3]);

            return (horizontal < Constants::EPSILON) ? 0.0 : (vertical1 + vertical2) / (2.0 * horizontal);
        }

        cv::Point2f centroid(const std::vector<cv::Point2f> &points)
        {
            if (points.empty())
                return cv::Point2f(0.0f, 0.0f);

            cv::Point2f sum(0.0f, 0.0f);
            for (const auto &p : points)
                sum += p;
            return sum * (1.0f / static_cast<float>(points.size()));
        }

        double horizontalExtent(const std::vector<cv::Point2f> &points)
        {
            if (points.empty())
                return 0.0;

            auto range = std::minmax_element(points.begin(), points.end(),
                                             [](const cv::Point2f &a, const cv::Point2f &b)
                                             {
                                                 return a.x < b.x;
                                             });
            return static_cast<double>(range.second->x - range.first->x);
        }

        cv::Scalar getSeverityColor(Severity severity, const Config &config)
        {
            switch (severity)
            {
            case Severity::INFO:
                return config.info_color;
            case Severity::WARNING:
                return config.warning_color;
            case Severity::CRITICAL:
                return config.danger_color;
            default:
                return cv::Scalar(128, 128, 128); // Gray for unknown states
            }
        }

        std::string formatDouble(double value, int precision)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(precision) << value;
            return oss.str();
        }
    }
}
