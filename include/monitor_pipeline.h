#ifndef MONITOR_PIPELINE_H
#define MONITOR_PIPELINE_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>
#include <opencv2/opencv.hpp>
#include "alert_coordinator.h"
#include "config.h"
#include "distance_estimator.h"
#include "facial_landmark_detector.h"
#include "fatigue_analyzer.h"
#include "frame_source.h"
#include "metric_snapshot.h"
#include "posture_analyzer.h"
#include "presentation.h"

namespace DeskMonitor
{
    class MonitorPipeline
    {
    private:
        Config config_;
        std::unique_ptr<FrameSource> source_;
        std::unique_ptr<LandmarkDetector> detector_;

        FatigueAnalyzer fatigue_analyzer_;
        DistanceEstimator distance_estimator_;
        PostureAnalyzer posture_analyzer_;
        AlertCoordinator coordinator_;

        SnapshotStore store_;
        std::vector<std::shared_ptr<SnapshotSink>> sinks_;

        std::atomic<bool> stop_requested_{false};
        bool cleaned_up_ = false;

        std::uint64_t frame_index_ = 0;
        int unavailable_reads_ = 0;
        bool has_session_start_ = false;
        Timestamp session_start_;
        bool has_last_face_ = false;
        Timestamp last_face_;
        bool has_last_processed_ = false;
        Timestamp last_processed_;
        double fps_ = 0.0;

        DetectionStatus detect(const cv::Mat &frame, LandmarkSet &landmarks);
        void markGap(MetricSnapshot &snapshot);
        double secondsWithoutFace(Timestamp timestamp) const;
        void updateFps(Timestamp timestamp);
        void publish(const MetricSnapshot &snapshot, const cv::Mat &frame);
        void publishCameraUnavailable(Timestamp timestamp);

    public:
        MonitorPipeline(const Config &config, std::unique_ptr<FrameSource> source,
                        std::unique_ptr<LandmarkDetector> detector);
        ~MonitorPipeline();

        void addNotifier(std::shared_ptr<Notifier> notifier);
        void addSink(std::shared_ptr<SnapshotSink> sink);

        /**
         * @brief Read, detect, analyze and publish until stopped or the source closes
         * @return EXIT_SUCCESS after stop(), non-zero when the frame source closed
         */
        int run();

        // One frame through detection, the analyzers, the coordinator and the sinks
        MetricSnapshot processFrame(const cv::Mat &frame, Timestamp timestamp);

        // Safe to call from a signal handler or another thread
        void stop() { stop_requested_ = true; }
        bool isStopRequested() const { return stop_requested_; }

        // Fresh session: analyzers, alert records and counters start over
        void resetSession();
        void cleanup();

        std::shared_ptr<const MetricSnapshot> latestSnapshot() const { return store_.latest(); }
        const AlertCoordinator &coordinator() const { return coordinator_; }
    };
}

#endif // MONITOR_PIPELINE_H
