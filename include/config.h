#ifndef CONFIG_H
#define CONFIG_H

#include <stdexcept>
#include <string>
#include <opencv2/core.hpp>

namespace DeskMonitor
{
    enum class LogLevel
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
    };

    struct Config
    {
        // Fatigue thresholds
        double ear_threshold = 0.25;
        double perclos_threshold = 0.15;
        double perclos_severe_threshold = 0.20;
        double perclos_window_seconds = 60.0;
        double perclos_warmup_seconds = 10.0;
        double microsleep_seconds = 2.0;
        double blink_rate_low = 10.0;  // blinks per minute
        double blink_rate_high = 30.0; // blinks per minute
        double blink_window_seconds = 60.0;

        // Distance estimation
        double known_face_width_cm = 14.5;
        double known_eye_distance_cm = 6.3;
        double focal_length_px = 600.0; // calibrate with DistanceEstimator::calibrateFocalLength
        double warning_distance_cm = 50.0;
        double distance_sustain_seconds = 30.0;
        double distance_smoothing_alpha = 0.3;
        double eye_method_weight = 0.7; // weight of the inter-eye cue, rest goes to the face width cue

        // Posture, degrees. Positive pitch = head tilted down
        double pitch_threshold_down = 12.0;
        double pitch_threshold_up = -8.0;
        double posture_sustain_seconds = 60.0;
        int posture_max_failed_frames = 15;

        // Alerts
        double cooldown_time_seconds = 300.0;
        bool enable_console_alert = true;
        bool enable_speech_alert = false;
        std::string speech_command = "espeak-ng";
        bool enable_gpio_alert = false;
        std::string gpio_sysfs_root = "/sys/class/gpio";
        int led_gpio_pin = 17;
        int buzzer_gpio_pin = 18;

        // Camera
        int camera_index = 0;
        std::string video_path = ""; // empty = live camera
        int frame_width = 640;
        int frame_height = 480;
        int frame_skip = 1; // Process every N frames
        int camera_max_read_failures = 30;
        int camera_unavailable_status_frames = 5; // missed reads before status turns CAMERA_UNAVAILABLE

        // Landmark detection
        std::string model_path = "models/shape_predictor_68_face_landmarks.dat";
        int detector_upsample = 0;

        // Logging options
        bool enable_console_logging = true;
        bool enable_file_logging = true;
        bool enable_file_logging_json = true;
        std::string log_path = "logs/";
        std::string log_filename = "desk_monitor_events.jsonl";
        std::string console_log_level = "info";

        // Zero Mq Configurations
        std::string zmq_endpoint = "tcp://*:5555";
        bool enable_publishing = false;

        // Display settings
        bool show_window = true;
        bool show_debug_info = true;
        cv::Scalar ok_color = cv::Scalar(0, 255, 0);
        cv::Scalar info_color = cv::Scalar(255, 200, 0);
        cv::Scalar warning_color = cv::Scalar(0, 165, 255);
        cv::Scalar danger_color = cv::Scalar(0, 0, 255);
    };

    /**
     * @brief Check every tunable for range and consistency
     * @throws ConfigError naming the first offending key
     */
    void validateConfig(const Config &config);

    /**
     * @brief Read a JSON object of overrides on top of the defaults, then validate
     * @throws ConfigError on missing file, parse error, unknown key, wrong type or bad value
     */
    Config loadConfigFile(const std::string &path);

    LogLevel parseLogLevel(const std::string &name);
    std::string logLevelToString(LogLevel level);
}

#endif // CONFIG_H
