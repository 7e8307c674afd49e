#ifndef DISTANCE_ESTIMATOR_H
#define DISTANCE_ESTIMATOR_H

#include <string>
#include "config.h"
#include "landmark_set.h"
#include "sustain_timer.h"
#include "timestamp.h"

namespace DeskMonitor
{
    enum class DistanceZone
    {
        TOO_CLOSE,
        CLOSE,
        NORMAL,
        FAR,
        UNKNOWN
    };

    struct DistanceSnapshot
    {
        double raw_bbox_estimate = 0.0; // cm, 0 when the face width cue was unusable
        double raw_eye_estimate = 0.0;  // cm, 0 when the inter-eye cue was unusable
        double smoothed_distance = 0.0;
        bool is_too_close = false;
        double sustained_seconds = 0.0;
        DistanceZone zone = DistanceZone::UNKNOWN;
        bool valid = false;
    };

    /**
     * @brief Monocular face-to-screen distance from the pinhole model.
     *
     * Two cues (face width and inter-eye distance) are blended, then smoothed
     * with an exponential moving average.
     */
    class DistanceEstimator
    {
    private:
        Config config_;
        SustainTimer too_close_timer_;
        bool has_estimate_ = false;
        double smoothed_distance_ = 0.0;
        DistanceSnapshot last_snapshot_;

        DistanceZone classifyZone(double distance_cm) const;

    public:
        explicit DistanceEstimator(const Config &config);

        DistanceSnapshot update(const LandmarkSet &landmarks, int frame_width, int frame_height, Timestamp timestamp);

        // Pauses the sustain timer and returns the last snapshot
        DistanceSnapshot markNoFace();

        void reset();

        const DistanceSnapshot &lastSnapshot() const { return last_snapshot_; }

        /**
         * @brief Focal length from one reading at a tape-measured distance
         * @param measured_distance_cm distance of the face from the camera
         * @param bbox_width_px face width in pixels at that distance
         * @param known_face_width_cm real face width
         * @return focal length in pixels, 0 when the inputs are not positive
         */
        static double calibrateFocalLength(double measured_distance_cm, double bbox_width_px,
                                           double known_face_width_cm);

        static std::string zoneToString(DistanceZone zone);
    };
}

#endif // DISTANCE_ESTIMATOR_H
