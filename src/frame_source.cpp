#include "../include/frame_source.h"
#include "../include/logger.h"
#include <filesystem>

namespace DeskMonitor
{
    VideoCaptureSource::VideoCaptureSource(const Config &config)
        : video_path_(config.video_path),
          camera_index_(config.camera_index),
          frame_width_(config.frame_width),
          frame_height_(config.frame_height),
          max_read_failures_(config.camera_max_read_failures)
    {
    }

    bool VideoCaptureSource::open()
    {
        if (isFile())
        {
            if (!std::filesystem::exists(video_path_))
            {
                Logger::error("VideoCaptureSource", "video file not found: " + video_path_);
                return false;
            }
            cap_.open(video_path_);
        }
        else
        {
            cap_.open(camera_index_);
            if (cap_.isOpened())
            {
                cap_.set(cv::CAP_PROP_FRAME_WIDTH, frame_width_);
                cap_.set(cv::CAP_PROP_FRAME_HEIGHT, frame_height_);
            }
        }

        if (!cap_.isOpened())
        {
            Logger::error("VideoCaptureSource", "failed to open video source");
            return false;
        }

        Logger::info("VideoCaptureSource", isFile() ? "reading " + video_path_
                                                    : "camera " + std::to_string(camera_index_) + " opened");
        consecutive_failures_ = 0;
        return true;
    }

    FrameStatus VideoCaptureSource::read(cv::Mat &frame, Timestamp &timestamp)
    {
        if (!cap_.isOpened())
            return FrameStatus::CLOSED;

        if (cap_.read(frame) && !frame.empty())
        {
            consecutive_failures_ = 0;
            timestamp = Clock::now();
            return FrameStatus::OK;
        }

        // End of a file is final; a camera gets a few retries
        if (isFile())
            return FrameStatus::CLOSED;

        if (++consecutive_failures_ >= max_read_failures_)
        {
            Logger::error("VideoCaptureSource", "camera gave no frame for " +
                                                    std::to_string(consecutive_failures_) + " reads");
            return FrameStatus::CLOSED;
        }

        Logger::debug("VideoCaptureSource", "frame read failed");
        return FrameStatus::UNAVAILABLE;
    }

    void VideoCaptureSource::release()
    {
        if (cap_.isOpened())
            cap_.release();
    }
}
