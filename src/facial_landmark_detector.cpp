#include "../include/facial_landmark_detector.h"
#include "../include/constants.h"
#include "../include/logger.h"
#include <algorithm>

namespace DeskMonitor
{
    namespace
    {
        // dlib 68 point index -> Face Mesh index
        struct PointMapping
        {
            int dlib_index;
            int mesh_index;
        };

        constexpr int DLIB_NOSE_TIP = 30;
        constexpr int DLIB_CHIN = 8;
        constexpr int DLIB_LEFT_EYE_START = 36;
        constexpr int DLIB_RIGHT_EYE_START = 42;
        constexpr int DLIB_LEFT_MOUTH_CORNER = 48;
        constexpr int DLIB_RIGHT_MOUTH_CORNER = 54;

        // Jaw line 0..16, image left to right
        constexpr int JAW_TO_OVAL[17] = {234, 93, 132, 58, 172, 136, 150, 176, 152,
                                         400, 379, 365, 397, 288, 361, 323, 454};

        std::vector<PointMapping> buildMappings()
        {
            std::vector<PointMapping> mappings;
            // dlib eyes run outer/upper/upper/inner/lower/lower, the same order as the EAR indices
            for (int i = 0; i < 6; ++i)
            {
                mappings.push_back({DLIB_LEFT_EYE_START + i, LandmarkIndices::LEFT_EYE[i]});
                mappings.push_back({DLIB_RIGHT_EYE_START + i, LandmarkIndices::RIGHT_EYE[i]});
            }
            for (int i = 0; i < 17; ++i)
                mappings.push_back({i, JAW_TO_OVAL[i]});

            mappings.push_back({DLIB_NOSE_TIP, LandmarkIndices::NOSE_TIP});
            mappings.push_back({DLIB_CHIN, LandmarkIndices::CHIN});
            mappings.push_back({DLIB_LEFT_MOUTH_CORNER, LandmarkIndices::LEFT_MOUTH_CORNER});
            mappings.push_back({DLIB_RIGHT_MOUTH_CORNER, LandmarkIndices::RIGHT_MOUTH_CORNER});
            return mappings;
        }
    }

    std::string detectionStatusToString(DetectionStatus status)
    {
        switch (status)
        {
        case DetectionStatus::FACE_FOUND:
            return "FACE_FOUND";
        case DetectionStatus::NO_FACE:
            return "NO_FACE";
        case DetectionStatus::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
        }
    }

    bool DlibLandmarkDetector::initialize(const std::string &model_path, int upsample)
    {
        try
        {
            face_detector_ = dlib::get_frontal_face_detector();
            dlib::deserialize(model_path) >> landmark_predictor_;
            upsample_ = static_cast<unsigned long>(std::max(0, upsample));
            is_initialized_ = true;
            Logger::info("DlibLandmarkDetector", "loaded " + model_path);
            return true;
        }
        catch (const std::exception &e)
        {
            Logger::error("DlibLandmarkDetector", "failed to load '" + model_path + "': " + e.what());
            return false;
        }
    }

    DetectionStatus DlibLandmarkDetector::detect(const cv::Mat &frame, LandmarkSet &landmarks)
    {
        if (!is_initialized_ || frame.empty())
            return DetectionStatus::FAILED;

        try
        {
            dlib::cv_image<dlib::bgr_pixel> dlib_img(frame);
            std::vector<dlib::rectangle> faces = face_detector_(dlib_img, upsample_);

            if (faces.empty())
                return DetectionStatus::NO_FACE;

            // Use the largest face (most confident detection)
            dlib::rectangle face = *std::max_element(faces.begin(), faces.end(),
                                                     [](const dlib::rectangle &a, const dlib::rectangle &b)
                                                     {
                                                         return a.area() < b.area();
                                                     });

            dlib::full_object_detection shape = landmark_predictor_(dlib_img, face);
            if (shape.num_parts() != static_cast<unsigned long>(Constants::DLIB_LANDMARK_COUNT))
                return DetectionStatus::FAILED;

            std::vector<cv::Point2f> points;
            points.reserve(Constants::DLIB_LANDMARK_COUNT);
            for (unsigned long i = 0; i < shape.num_parts(); ++i)
                points.emplace_back(shape.part(i).x(), shape.part(i).y());

            return mapToFaceMesh(points, frame.size(), landmarks) ? DetectionStatus::FACE_FOUND
                                                                  : DetectionStatus::FAILED;
        }
        catch (const std::exception &e)
        {
            Logger::warn("DlibLandmarkDetector", std::string("detection failed: ") + e.what());
            return DetectionStatus::FAILED;
        }
    }

    bool DlibLandmarkDetector::mapToFaceMesh(const std::vector<cv::Point2f> &points, const cv::Size &frame_size,
                                             LandmarkSet &landmarks)
    {
        if (points.size() != static_cast<size_t>(Constants::DLIB_LANDMARK_COUNT) ||
            frame_size.width <= 0 || frame_size.height <= 0)
            return false;

        auto normalize = [&frame_size](const cv::Point2f &p)
        {
            return cv::Point3f(p.x / frame_size.width, p.y / frame_size.height, 0.0f);
        };

        LandmarkSet mapped;
        cv::Point3f nose = normalize(points[DLIB_NOSE_TIP]);
        for (int i = 0; i < LandmarkSet::size(); ++i)
            mapped.set(i, nose);

        static const std::vector<PointMapping> mappings = buildMappings();
        for (const auto &mapping : mappings)
            mapped.set(mapping.mesh_index, normalize(points[mapping.dlib_index]));

        landmarks = mapped;
        return true;
    }
}
