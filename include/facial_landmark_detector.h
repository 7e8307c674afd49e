#ifndef FACIAL_LANDMARK_DETECTOR_H
#define FACIAL_LANDMARK_DETECTOR_H

#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include <dlib/opencv.h>
#include <dlib/image_processing/frontal_face_detector.h>
#include <dlib/image_processing.h>
#include "config.h"
#include "landmark_set.h"

namespace DeskMonitor
{
    enum class DetectionStatus
    {
        FACE_FOUND,
        NO_FACE,
        FAILED
    };

    std::string detectionStatusToString(DetectionStatus status);

    class LandmarkDetector
    {
    public:
        virtual ~LandmarkDetector() = default;

        // Fills landmarks only on FACE_FOUND
        virtual DetectionStatus detect(const cv::Mat &frame, LandmarkSet &landmarks) = 0;
    };

    /**
     * @brief dlib HOG face detector + 68 point shape predictor.
     *
     * The 68 points are placed at their Face Mesh indices (eyes, nose tip,
     * chin, mouth corners, jaw line on the face oval). Indices dlib has no
     * counterpart for hold the nose tip so they never widen the face extent.
     */
    class DlibLandmarkDetector : public LandmarkDetector
    {
    private:
        dlib::frontal_face_detector face_detector_;
        dlib::shape_predictor landmark_predictor_;
        unsigned long upsample_ = 0;
        bool is_initialized_ = false;

    public:
        bool initialize(const std::string &model_path, int upsample = 0);
        bool isInitialized() const { return is_initialized_; }

        DetectionStatus detect(const cv::Mat &frame, LandmarkSet &landmarks) override;

        /**
         * @brief Place 68 dlib points (pixels) into a Face Mesh landmark set
         * @return false when points does not hold exactly 68 entries or the frame is empty
         */
        static bool mapToFaceMesh(const std::vector<cv::Point2f> &points, const cv::Size &frame_size,
                                  LandmarkSet &landmarks);
    };
}

#endif // FACIAL_LANDMARK_DETECTOR_H
