#ifndef LANDMARK_SET_H
#define LANDMARK_SET_H

#include <array>
#include <vector>
#include <opencv2/core.hpp>
#include "constants.h"

namespace DeskMonitor
{
    /**
     * @brief One frame of Face Mesh landmarks.
     *
     * x and y are normalized to [0,1] against the frame they were detected in,
     * z is the detector's relative depth. Produced by a LandmarkDetector and
     * read (never modified) by the analyzers.
     */
    class LandmarkSet
    {
    private:
        std::array<cv::Point3f, Constants::FACE_MESH_LANDMARK_COUNT> points_;

    public:
        LandmarkSet();
        explicit LandmarkSet(const std::vector<cv::Point3f> &points);

        static constexpr int size() { return Constants::FACE_MESH_LANDMARK_COUNT; }

        const cv::Point3f &at(int index) const;
        void set(int index, const cv::Point3f &point);

        // Pixel coordinates for a frame of the given size
        cv::Point2f pixel(int index, const cv::Size &frame_size) const;
    };
}

#endif // LANDMARK_SET_H
