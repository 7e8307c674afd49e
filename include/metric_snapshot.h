#ifndef METRIC_SNAPSHOT_H
#define METRIC_SNAPSHOT_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "alert_types.h"
#include "distance_estimator.h"
#include "fatigue_analyzer.h"
#include "posture_analyzer.h"

namespace DeskMonitor
{
    enum class PipelineStatus
    {
        MONITORING,
        NO_FACE,
        DETECTOR_ERROR,
        CAMERA_UNAVAILABLE,
        STOPPED
    };

    std::string pipelineStatusToString(PipelineStatus status);

    // Everything the presentation layer gets for one processed frame
    struct MetricSnapshot
    {
        FatigueSnapshot fatigue;
        DistanceSnapshot distance;
        PostureSnapshot posture;
        std::vector<ConditionType> active_alerts; // descending severity
        bool face_present = false;
        PipelineStatus status = PipelineStatus::MONITORING;
        double seconds_without_face = 0.0;
        std::uint64_t frame_index = 0;
        double fps = 0.0;
    };

    /**
     * @brief Latest snapshot, shared between the pipeline thread and readers.
     *
     * publish() swaps in a new immutable snapshot; readers hold their own
     * reference, so they never see a snapshot being written.
     */
    class SnapshotStore
    {
    private:
        mutable std::mutex mutex_;
        std::shared_ptr<const MetricSnapshot> latest_;

    public:
        SnapshotStore() : latest_(std::make_shared<const MetricSnapshot>()) {}

        void publish(MetricSnapshot snapshot)
        {
            auto next = std::make_shared<const MetricSnapshot>(std::move(snapshot));
            std::lock_guard<std::mutex> lock(mutex_);
            latest_ = std::move(next);
        }

        std::shared_ptr<const MetricSnapshot> latest() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return latest_;
        }
    };
}

#endif // METRIC_SNAPSHOT_H
