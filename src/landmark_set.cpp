#include "../include/landmark_set.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace DeskMonitor
{
    LandmarkSet::LandmarkSet()
    {
        points_.fill(cv::Point3f(0.0f, 0.0f, 0.0f));
    }

    LandmarkSet::LandmarkSet(const std::vector<cv::Point3f> &points)
    {
        if (points.size() != points_.size())
        {
            throw std::invalid_argument("LandmarkSet: expected " + std::to_string(points_.size()) +
                                        " points, got " + std::to_string(points.size()));
        }
        std::copy(points.begin(), points.end(), points_.begin());
    }

    const cv::Point3f &LandmarkSet::at(int index) const
    {
        if (index < 0 || index >= size())
            throw std::out_of_range("LandmarkSet: index " + std::to_string(index) + " out of range");
        return points_[index];
    }

    void LandmarkSet::set(int index, const cv::Point3f &point)
    {
        if (index < 0 || index >= size())
            throw std::out_of_range("LandmarkSet: index " + std::to_string(index) + " out of range");
        points_[index] = point;
    }

    cv::Point2f LandmarkSet::pixel(int index, const cv::Size &frame_size) const
    {
        const cv::Point3f &p = at(index);
        return cv::Point2f(p.x * static_cast<float>(frame_size.width),
                           p.y * static_cast<float>(frame_size.height));
    }
}
