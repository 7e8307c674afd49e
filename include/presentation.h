#ifndef PRESENTATION_H
#define PRESENTATION_H

#include <memory>
#include <string>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "message_publisher.h"
#include "metric_snapshot.h"

namespace DeskMonitor
{
    // Receives every published snapshot. Failures stay inside the sink
    class SnapshotSink
    {
    public:
        virtual ~SnapshotSink() = default;
        virtual void publish(const MetricSnapshot &snapshot, const cv::Mat &frame) = 0;
        virtual void shutdown() {}

        // A sink with a user interface may ask the pipeline to stop
        virtual bool stopRequested() const { return false; }
    };

    class ZmqSnapshotSink : public SnapshotSink
    {
    private:
        std::shared_ptr<MessagePublisher> publisher_;

    public:
        explicit ZmqSnapshotSink(std::shared_ptr<MessagePublisher> publisher);

        void publish(const MetricSnapshot &snapshot, const cv::Mat &frame) override;
        void shutdown() override;
    };

    class OverlayRenderer : public SnapshotSink
    {
    private:
        Config config_;
        std::string window_name_;
        bool stop_requested_ = false;

        void drawStatus(cv::Mat &frame, const MetricSnapshot &snapshot);
        void drawMetrics(cv::Mat &frame, const MetricSnapshot &snapshot);
        void drawAlertBanner(cv::Mat &frame, const MetricSnapshot &snapshot);
        void drawHealthBar(cv::Mat &frame, int health_score);

    public:
        explicit OverlayRenderer(const Config &config, const std::string &window_name = "Desk Monitor");

        // Draws onto a copy of the frame, shows it and polls the keyboard (ESC stops)
        void publish(const MetricSnapshot &snapshot, const cv::Mat &frame) override;
        void render(cv::Mat &frame, const MetricSnapshot &snapshot);
        void shutdown() override;
        bool stopRequested() const override { return stop_requested_; }

        // 100 minus penalties for fatigue level, proximity and sustained bad posture, floored at 0
        static int healthScore(const MetricSnapshot &snapshot);
    };
}

#endif // PRESENTATION_H
