#include "../include/monitor_pipeline.h"
#include "../include/logger.h"
#include <algorithm>
#include <cstdlib>

namespace DeskMonitor
{
    namespace
    {
        constexpr double FPS_SMOOTHING = 0.1;
    }

    MonitorPipeline::MonitorPipeline(const Config &config, std::unique_ptr<FrameSource> source,
                                     std::unique_ptr<LandmarkDetector> detector)
        : config_(config),
          source_(std::move(source)),
          detector_(std::move(detector)),
          fatigue_analyzer_(config),
          distance_estimator_(config),
          posture_analyzer_(config),
          coordinator_(config)
    {
    }

    MonitorPipeline::~MonitorPipeline()
    {
        for (const auto &sink : sinks_)
            sink->shutdown();
    }

    void MonitorPipeline::addNotifier(std::shared_ptr<Notifier> notifier)
    {
        coordinator_.addNotifier(std::move(notifier));
    }

    void MonitorPipeline::addSink(std::shared_ptr<SnapshotSink> sink)
    {
        if (sink)
            sinks_.push_back(std::move(sink));
    }

    int MonitorPipeline::run()
    {
        if (!source_ || !detector_)
        {
            Logger::error("MonitorPipeline", "missing frame source or landmark detector");
            return EXIT_FAILURE;
        }

        Logger::info("MonitorPipeline", "monitoring started");

        int exit_code = EXIT_SUCCESS;
        int frame_count = 0;
        size_t processed_frames = 0;

        while (!stop_requested_)
        {
            cv::Mat frame;
            Timestamp timestamp;
            FrameStatus status = source_->read(frame, timestamp);

            if (status == FrameStatus::CLOSED)
            {
                Logger::error("MonitorPipeline", "frame source closed, stopping");
                exit_code = EXIT_FAILURE;
                break;
            }

            if (status == FrameStatus::UNAVAILABLE)
            {
                publishCameraUnavailable(Clock::now());
                continue;
            }
            unavailable_reads_ = 0;

            // Skip frames for performance if configured
            if (++frame_count % config_.frame_skip != 0)
                continue;

            processFrame(frame, timestamp);
            processed_frames++;

            for (const auto &sink : sinks_)
            {
                if (sink->stopRequested())
                    stop_requested_ = true;
            }
        }

        Logger::info("MonitorPipeline", "total processed frames: " + std::to_string(processed_frames));
        cleanup();
        return exit_code;
    }

    MetricSnapshot MonitorPipeline::processFrame(const cv::Mat &frame, Timestamp timestamp)
    {
        if (!has_session_start_)
        {
            session_start_ = timestamp;
            has_session_start_ = true;
        }
        frame_index_++;
        updateFps(timestamp);

        MetricSnapshot snapshot;
        snapshot.frame_index = frame_index_;
        snapshot.fps = fps_;

        LandmarkSet landmarks;
        DetectionStatus detection = detect(frame, landmarks);

        if (detection == DetectionStatus::FACE_FOUND)
        {
            // The analyzers share nothing, so the order does not matter
            snapshot.fatigue = fatigue_analyzer_.update(landmarks, frame.size(), timestamp);
            snapshot.distance = distance_estimator_.update(landmarks, frame.cols, frame.rows, timestamp);
            snapshot.posture = posture_analyzer_.update(landmarks, frame.size(),
                                                        CameraIntrinsics::fromFrame(frame.size(), config_.focal_length_px),
                                                        timestamp);
            snapshot.face_present = true;
            snapshot.status = PipelineStatus::MONITORING;
            last_face_ = timestamp;
            has_last_face_ = true;
        }
        else
        {
            markGap(snapshot);
            snapshot.status = detection == DetectionStatus::NO_FACE ? PipelineStatus::NO_FACE
                                                                    : PipelineStatus::DETECTOR_ERROR;
        }
        snapshot.seconds_without_face = secondsWithoutFace(timestamp);

        AlertEvaluation evaluation = coordinator_.evaluate(snapshot, timestamp);
        snapshot.active_alerts = evaluation.active;

        publish(snapshot, frame);
        return snapshot;
    }

    DetectionStatus MonitorPipeline::detect(const cv::Mat &frame, LandmarkSet &landmarks)
    {
        if (!detector_)
            return DetectionStatus::FAILED;

        try
        {
            return detector_->detect(frame, landmarks);
        }
        catch (const std::exception &e)
        {
            Logger::warn("MonitorPipeline", std::string("landmark detector threw: ") + e.what());
            return DetectionStatus::FAILED;
        }
    }

    void MonitorPipeline::markGap(MetricSnapshot &snapshot)
    {
        snapshot.fatigue = fatigue_analyzer_.markNoFace();
        snapshot.distance = distance_estimator_.markNoFace();
        snapshot.posture = posture_analyzer_.markNoFace();
        snapshot.face_present = false;
    }

    double MonitorPipeline::secondsWithoutFace(Timestamp timestamp) const
    {
        if (has_last_face_)
            return std::max(0.0, secondsBetween(last_face_, timestamp));
        if (has_session_start_)
            return std::max(0.0, secondsBetween(session_start_, timestamp));
        return 0.0;
    }

    void MonitorPipeline::updateFps(Timestamp timestamp)
    {
        if (has_last_processed_)
        {
            double dt = secondsBetween(last_processed_, timestamp);
            if (dt > 0.0)
                fps_ = fps_ <= 0.0 ? 1.0 / dt : fps_ + FPS_SMOOTHING * (1.0 / dt - fps_);
        }
        last_processed_ = timestamp;
        has_last_processed_ = true;
    }

    void MonitorPipeline::publishCameraUnavailable(Timestamp timestamp)
    {
        unavailable_reads_++;
        if (unavailable_reads_ < config_.camera_unavailable_status_frames)
            return;

        if (unavailable_reads_ == config_.camera_unavailable_status_frames)
            Logger::warn("MonitorPipeline", "camera unavailable");

        MetricSnapshot snapshot;
        markGap(snapshot);
        snapshot.status = PipelineStatus::CAMERA_UNAVAILABLE;
        snapshot.frame_index = frame_index_;
        snapshot.seconds_without_face = secondsWithoutFace(timestamp);

        cv::Mat blank = cv::Mat::zeros(config_.frame_height, config_.frame_width, CV_8UC3);
        publish(snapshot, blank);
    }

    void MonitorPipeline::publish(const MetricSnapshot &snapshot, const cv::Mat &frame)
    {
        store_.publish(snapshot);

        for (const auto &sink : sinks_)
        {
            try
            {
                sink->publish(snapshot, frame);
            }
            catch (const std::exception &e)
            {
                Logger::warn("MonitorPipeline", std::string("snapshot sink failed: ") + e.what());
            }
        }
    }

    void MonitorPipeline::resetSession()
    {
        fatigue_analyzer_.reset();
        distance_estimator_.reset();
        posture_analyzer_.reset();
        coordinator_.resetAll();

        frame_index_ = 0;
        unavailable_reads_ = 0;
        has_session_start_ = false;
        has_last_face_ = false;
        has_last_processed_ = false;
        fps_ = 0.0;
        store_.publish(MetricSnapshot());
        Logger::info("MonitorPipeline", "session reset");
    }

    void MonitorPipeline::cleanup()
    {
        if (cleaned_up_)
            return;
        cleaned_up_ = true;

        for (const auto &sink : sinks_)
            sink->shutdown();
        sinks_.clear();

        MetricSnapshot stopped = *store_.latest();
        stopped.status = PipelineStatus::STOPPED;
        store_.publish(stopped);

        Logger::info("MonitorPipeline", "shutdown complete");
        Logger::shutdown();
    }
}
