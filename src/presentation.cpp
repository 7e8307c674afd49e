#include "../include/presentation.h"
#include "../include/constants.h"
#include "../include/cv_utils.h"
#include "../include/logger.h"
#include "../include/snapshot_json.h"
#include <algorithm>

namespace DeskMonitor
{
    ZmqSnapshotSink::ZmqSnapshotSink(std::shared_ptr<MessagePublisher> publisher) : publisher_(std::move(publisher)) {}

    void ZmqSnapshotSink::publish(const MetricSnapshot &snapshot, const cv::Mat &frame)
    {
        (void)frame;
        if (!publisher_ || !publisher_->isReady())
            return;

        nlohmann::json snapshot_json = snapshot;
        if (!publisher_->publish(MessagePublisher::SNAPSHOT_TOPIC, snapshot_json.dump()))
            Logger::debug("ZmqSnapshotSink", "snapshot " + std::to_string(snapshot.frame_index) + " not sent");
    }

    void ZmqSnapshotSink::shutdown()
    {
        if (publisher_)
            publisher_->shutdown();
    }

    OverlayRenderer::OverlayRenderer(const Config &config, const std::string &window_name)
        : config_(config), window_name_(window_name)
    {
    }

    int OverlayRenderer::healthScore(const MetricSnapshot &snapshot)
    {
        int score = 100;
        if (snapshot.fatigue.valid)
            score -= 20 * std::min(3, std::max(0, snapshot.fatigue.fatigue_level));
        if (snapshot.distance.valid && snapshot.distance.is_too_close)
            score -= 20;
        if (snapshot.posture.valid && snapshot.posture.is_sustained)
            score -= 20;
        return std::max(0, score);
    }

    void OverlayRenderer::publish(const MetricSnapshot &snapshot, const cv::Mat &frame)
    {
        if (frame.empty())
            return;

        cv::Mat canvas = frame.clone();
        render(canvas, snapshot);
        cv::imshow(window_name_, canvas);
        if (cv::waitKey(Constants::WAIT_KEY_MS) == Constants::ESC_KEY)
            stop_requested_ = true;
    }

    void OverlayRenderer::render(cv::Mat &frame, const MetricSnapshot &snapshot)
    {
        drawStatus(frame, snapshot);
        if (snapshot.face_present && config_.show_debug_info)
            drawMetrics(frame, snapshot);
        drawAlertBanner(frame, snapshot);
        drawHealthBar(frame, healthScore(snapshot));
    }

    void OverlayRenderer::drawStatus(cv::Mat &frame, const MetricSnapshot &snapshot)
    {
        std::string status_text;
        cv::Scalar color = config_.ok_color;

        switch (snapshot.status)
        {
        case PipelineStatus::MONITORING:
            status_text = "Monitoring";
            break;
        case PipelineStatus::NO_FACE:
            status_text = "No Face Detected (" + CVUtils::formatDouble(snapshot.seconds_without_face, 0) + "s)";
            color = config_.warning_color;
            break;
        case PipelineStatus::DETECTOR_ERROR:
            status_text = "Detector Error";
            color = config_.danger_color;
            break;
        case PipelineStatus::CAMERA_UNAVAILABLE:
            status_text = "Camera Unavailable";
            color = config_.danger_color;
            break;
        default:
            status_text = pipelineStatusToString(snapshot.status);
            break;
        }

        cv::putText(frame, status_text, cv::Point(20, 40),
                    cv::FONT_HERSHEY_SIMPLEX, 1.0, color, 2);

        if (config_.show_debug_info)
        {
            cv::putText(frame, "FPS: " + CVUtils::formatDouble(snapshot.fps, 1),
                        cv::Point(20, frame.rows - 20), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(200, 200, 200), 1);
        }
    }

    void OverlayRenderer::drawMetrics(cv::Mat &frame, const MetricSnapshot &snapshot)
    {
        const cv::Scalar text_color(255, 255, 255);
        int y = 80;

        const FatigueSnapshot &fatigue = snapshot.fatigue;
        cv::putText(frame, "EAR: " + CVUtils::formatDouble(fatigue.ear_avg),
                    cv::Point(20, y), cv::FONT_HERSHEY_SIMPLEX, 0.6, text_color, 2);
        cv::putText(frame, "PERCLOS: " + (fatigue.perclos_valid ? CVUtils::formatDouble(fatigue.perclos * 100.0, 1) + "%" : std::string("--")),
                    cv::Point(20, y += 25), cv::FONT_HERSHEY_SIMPLEX, 0.6, text_color, 2);
        cv::putText(frame, "Blinks: " + std::to_string(fatigue.blink_count_total) + " (" +
                               CVUtils::formatDouble(fatigue.blinks_per_minute, 0) + "/min)",
                    cv::Point(20, y += 25), cv::FONT_HERSHEY_SIMPLEX, 0.6, text_color, 2);
        if (fatigue.is_blinking)
        {
            cv::putText(frame, "Eyes Closed: " + CVUtils::formatDouble(fatigue.closed_duration, 1) + "s",
                        cv::Point(20, y += 25), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 0), 2);
        }

        const DistanceSnapshot &distance = snapshot.distance;
        if (distance.valid)
        {
            cv::Scalar distance_color = distance.zone == DistanceZone::TOO_CLOSE || distance.zone == DistanceZone::CLOSE
                                            ? config_.warning_color
                                            : text_color;
            cv::putText(frame, "Distance: " + CVUtils::formatDouble(distance.smoothed_distance, 1) + "cm (" +
                                   DistanceEstimator::zoneToString(distance.zone) + ")",
                        cv::Point(20, y += 25), cv::FONT_HERSHEY_SIMPLEX, 0.6, distance_color, 2);
        }

        const PostureSnapshot &posture = snapshot.posture;
        if (posture.valid)
        {
            cv::Scalar posture_color = posture.posture_state == PostureState::NORMAL ? text_color : config_.warning_color;
            cv::putText(frame, "Head: " + PostureAnalyzer::postureStateToString(posture.posture_state),
                        cv::Point(20, y += 25), cv::FONT_HERSHEY_SIMPLEX, 0.6, posture_color, 2);
            cv::putText(frame, "Pitch: " + CVUtils::formatDouble(posture.pitch, 1) +
                                   " Yaw: " + CVUtils::formatDouble(posture.yaw, 1) +
                                   " Roll: " + CVUtils::formatDouble(posture.roll, 1),
                        cv::Point(20, y += 22), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(200, 200, 200), 1);
        }

        // Thresholds
        cv::putText(frame, "EAR Thresh: " + CVUtils::formatDouble(config_.ear_threshold),
                    cv::Point(20, frame.rows - 60), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(200, 200, 200), 1);
        cv::putText(frame, "Pitch Thresh: " + CVUtils::formatDouble(config_.pitch_threshold_up, 0) + "/" +
                               CVUtils::formatDouble(config_.pitch_threshold_down, 0),
                    cv::Point(20, frame.rows - 40), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(200, 200, 200), 1);
    }

    void OverlayRenderer::drawAlertBanner(cv::Mat &frame, const MetricSnapshot &snapshot)
    {
        if (snapshot.active_alerts.empty())
            return;

        // Highest severity first
        ConditionType top = snapshot.active_alerts.front();
        std::string warning_text = conditionToString(top);
        cv::Scalar color = CVUtils::getSeverityColor(conditionSeverity(top), config_);

        int baseline = 0;
        cv::Size text_size = cv::getTextSize(warning_text, cv::FONT_HERSHEY_SIMPLEX, 0.9, 2, &baseline);
        int text_x = (frame.cols - text_size.width) / 2;
        int text_y = frame.rows / 2;
        int padding = 10;

        cv::rectangle(frame, cv::Point(text_x - padding, text_y - text_size.height - padding),
                      cv::Point(text_x + text_size.width + padding, text_y + padding), color, -1);
        cv::putText(frame, warning_text, cv::Point(text_x, text_y),
                    cv::FONT_HERSHEY_SIMPLEX, 0.9, cv::Scalar(255, 255, 255), 2);
    }

    void OverlayRenderer::drawHealthBar(cv::Mat &frame, int health_score)
    {
        const int bar_width = 200;
        const int bar_height = 25;
        int bar_x = frame.cols - bar_width - 20;
        int bar_y = 50;

        cv::Scalar bar_color;
        if (health_score >= 80)
            bar_color = cv::Scalar(0, 255, 0);
        else if (health_score >= 60)
            bar_color = cv::Scalar(0, 255, 255);
        else if (health_score >= 40)
            bar_color = cv::Scalar(0, 165, 255);
        else
            bar_color = cv::Scalar(0, 0, 255);

        cv::Rect outline(bar_x, bar_y, bar_width, bar_height);
        cv::rectangle(frame, outline, cv::Scalar(100, 100, 100), -1);
        cv::rectangle(frame, cv::Rect(bar_x, bar_y, bar_width * health_score / 100, bar_height), bar_color, -1);
        cv::rectangle(frame, outline, cv::Scalar(255, 255, 255), 2);
        cv::putText(frame, std::to_string(health_score) + "%", cv::Point(bar_x + bar_width / 2 - 30, bar_y + 18),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 2);
    }

    void OverlayRenderer::shutdown()
    {
        cv::destroyAllWindows();
    }
}
