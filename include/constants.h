#ifndef CONSTANTS_H
#define CONSTANTS_H

namespace DeskMonitor
{
    namespace Constants
    {
        constexpr int ESC_KEY = 27;
        constexpr int WAIT_KEY_MS = 1;
        constexpr double EPSILON = 1e-6;
        constexpr int MAX_LOG_ENTRIES = 1000;
        constexpr int FACE_MESH_LANDMARK_COUNT = 468;
        constexpr int DLIB_LANDMARK_COUNT = 68;
        constexpr double SECONDS_PER_MINUTE = 60.0;
        constexpr int PUBLISHER_LINGER_MS = 500;
        constexpr int PUBLISHER_SEND_HWM = 100;
    }

    // Face Mesh (468 point) indices. "Left" is the image-left side.
    namespace LandmarkIndices
    {
        // p1..p6 order used by the EAR formula: outer corner, upper lid x2, inner corner, lower lid x2
        constexpr int LEFT_EYE[6] = {33, 160, 158, 133, 153, 144};
        constexpr int RIGHT_EYE[6] = {362, 385, 387, 263, 373, 380};

        constexpr int NOSE_TIP = 1;
        constexpr int CHIN = 152;
        constexpr int LEFT_EYE_OUTER = 33;
        constexpr int RIGHT_EYE_OUTER = 263;
        constexpr int LEFT_MOUTH_CORNER = 61;
        constexpr int RIGHT_MOUTH_CORNER = 291;

        // Order matches the 3D model points in PostureAnalyzer
        constexpr int POSE_POINTS[6] = {NOSE_TIP, CHIN, LEFT_EYE_OUTER, RIGHT_EYE_OUTER,
                                        LEFT_MOUTH_CORNER, RIGHT_MOUTH_CORNER};

        constexpr int FACE_OVAL[36] = {10, 338, 297, 332, 284, 251, 389, 356, 454, 323, 361, 288,
                                       397, 365, 379, 378, 400, 377, 152, 148, 176, 149, 150, 136,
                                       172, 58, 132, 93, 234, 127, 162, 21, 54, 103, 67, 109};
    }
}

#endif // CONSTANTS_H
