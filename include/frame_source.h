#ifndef FRAME_SOURCE_H
#define FRAME_SOURCE_H

#include <string>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "timestamp.h"

namespace DeskMonitor
{
    enum class FrameStatus
    {
        OK,
        UNAVAILABLE, // skip this cycle and try again
        CLOSED       // no more frames will come
    };

    class FrameSource
    {
    public:
        virtual ~FrameSource() = default;
        virtual FrameStatus read(cv::Mat &frame, Timestamp &timestamp) = 0;
    };

    // Live camera or video file through cv::VideoCapture
    class VideoCaptureSource : public FrameSource
    {
    private:
        cv::VideoCapture cap_;
        std::string video_path_;
        int camera_index_;
        int frame_width_;
        int frame_height_;
        int max_read_failures_;
        int consecutive_failures_ = 0;

    public:
        explicit VideoCaptureSource(const Config &config);

        bool open();
        FrameStatus read(cv::Mat &frame, Timestamp &timestamp) override;
        void release();

        bool isFile() const { return !video_path_.empty(); }
    };
}

#endif // FRAME_SOURCE_H
