#include "../include/config.h"
#include <cmath>
#include <fstream>
#include <functional>
#include <map>
#include <utility>
#include <nlohmann/json.hpp>

namespace DeskMonitor
{
    namespace
    {
        void readValue(const nlohmann::json &value, const std::string &key, double &out)
        {
            if (!value.is_number())
                throw ConfigError("Config: '" + key + "' must be a number");
            out = value.get<double>();
        }

        void readValue(const nlohmann::json &value, const std::string &key, int &out)
        {
            if (!value.is_number_integer())
                throw ConfigError("Config: '" + key + "' must be an integer");
            out = value.get<int>();
        }

        void readValue(const nlohmann::json &value, const std::string &key, bool &out)
        {
            if (!value.is_boolean())
                throw ConfigError("Config: '" + key + "' must be true or false");
            out = value.get<bool>();
        }

        void readValue(const nlohmann::json &value, const std::string &key, std::string &out)
        {
            if (!value.is_string())
                throw ConfigError("Config: '" + key + "' must be a string");
            out = value.get<std::string>();
        }

        using FieldReader = std::function<void(Config &, const nlohmann::json &)>;

        template <typename T>
        std::pair<const std::string, FieldReader> field(const char *key, T Config::*member)
        {
            return {key, [key, member](Config &c, const nlohmann::json &v)
                    { readValue(v, key, c.*member); }};
        }

        const std::map<std::string, FieldReader> &fieldReaders()
        {
            static const std::map<std::string, FieldReader> readers = {
                field("ear_threshold", &Config::ear_threshold),
                field("perclos_threshold", &Config::perclos_threshold),
                field("perclos_severe_threshold", &Config::perclos_severe_threshold),
                field("perclos_window_seconds", &Config::perclos_window_seconds),
                field("perclos_warmup_seconds", &Config::perclos_warmup_seconds),
                field("microsleep_seconds", &Config::microsleep_seconds),
                field("blink_rate_low", &Config::blink_rate_low),
                field("blink_rate_high", &Config::blink_rate_high),
                field("blink_window_seconds", &Config::blink_window_seconds),
                field("known_face_width_cm", &Config::known_face_width_cm),
                field("known_eye_distance_cm", &Config::known_eye_distance_cm),
                field("focal_length_px", &Config::focal_length_px),
                field("warning_distance_cm", &Config::warning_distance_cm),
                field("distance_sustain_seconds", &Config::distance_sustain_seconds),
                field("distance_smoothing_alpha", &Config::distance_smoothing_alpha),
                field("eye_method_weight", &Config::eye_method_weight),
                field("pitch_threshold_down", &Config::pitch_threshold_down),
                field("pitch_threshold_up", &Config::pitch_threshold_up),
                field("posture_sustain_seconds", &Config::posture_sustain_seconds),
                field("posture_max_failed_frames", &Config::posture_max_failed_frames),
                field("cooldown_time_seconds", &Config::cooldown_time_seconds),
                field("enable_console_alert", &Config::enable_console_alert),
                field("enable_speech_alert", &Config::enable_speech_alert),
                field("speech_command", &Config::speech_command),
                field("enable_gpio_alert", &Config::enable_gpio_alert),
                field("gpio_sysfs_root", &Config::gpio_sysfs_root),
                field("led_gpio_pin", &Config::led_gpio_pin),
                field("buzzer_gpio_pin", &Config::buzzer_gpio_pin),
                field("camera_index", &Config::camera_index),
                field("video_path", &Config::video_path),
                field("frame_width", &Config::frame_width),
                field("frame_height", &Config::frame_height),
                field("frame_skip", &Config::frame_skip),
                field("camera_max_read_failures", &Config::camera_max_read_failures),
                field("camera_unavailable_status_frames", &Config::camera_unavailable_status_frames),
                field("model_path", &Config::model_path),
                field("detector_upsample", &Config::detector_upsample),
                field("enable_console_logging", &Config::enable_console_logging),
                field("enable_file_logging", &Config::enable_file_logging),
                field("enable_file_logging_json", &Config::enable_file_logging_json),
                field("log_path", &Config::log_path),
                field("log_filename", &Config::log_filename),
                field("console_log_level", &Config::console_log_level),
                field("zmq_endpoint", &Config::zmq_endpoint),
                field("enable_publishing", &Config::enable_publishing),
                field("show_window", &Config::show_window),
                field("show_debug_info", &Config::show_debug_info),
            };
            return readers;
        }

        void requireFinite(double value, const char *key)
        {
            if (!std::isfinite(value))
                throw ConfigError(std::string("Config: '") + key + "' must be finite");
        }

        void requirePositive(double value, const char *key)
        {
            requireFinite(value, key);
            if (value <= 0.0)
                throw ConfigError(std::string("Config: '") + key + "' must be > 0");
        }

        void requireNonNegative(double value, const char *key)
        {
            requireFinite(value, key);
            if (value < 0.0)
                throw ConfigError(std::string("Config: '") + key + "' must be >= 0");
        }

        void requireRange(double value, double low, double high, const char *key)
        {
            requireFinite(value, key);
            if (value < low || value > high)
                throw ConfigError(std::string("Config: '") + key + "' must be in [" +
                                  std::to_string(low) + ", " + std::to_string(high) + "]");
        }
    }

    void validateConfig(const Config &config)
    {
        requirePositive(config.ear_threshold, "ear_threshold");
        requireRange(config.ear_threshold, 0.0, 1.0, "ear_threshold");
        requirePositive(config.perclos_threshold, "perclos_threshold");
        requireRange(config.perclos_threshold, 0.0, 1.0, "perclos_threshold");
        requireRange(config.perclos_severe_threshold, config.perclos_threshold, 1.0, "perclos_severe_threshold");
        requirePositive(config.perclos_window_seconds, "perclos_window_seconds");
        requireRange(config.perclos_warmup_seconds, 0.0, config.perclos_window_seconds, "perclos_warmup_seconds");
        requirePositive(config.microsleep_seconds, "microsleep_seconds");
        requireNonNegative(config.blink_rate_low, "blink_rate_low");
        requirePositive(config.blink_rate_high, "blink_rate_high");
        if (config.blink_rate_low >= config.blink_rate_high)
            throw ConfigError("Config: 'blink_rate_low' must be below 'blink_rate_high'");
        requirePositive(config.blink_window_seconds, "blink_window_seconds");

        requirePositive(config.known_face_width_cm, "known_face_width_cm");
        requirePositive(config.known_eye_distance_cm, "known_eye_distance_cm");
        requirePositive(config.focal_length_px, "focal_length_px");
        requirePositive(config.warning_distance_cm, "warning_distance_cm");
        requireNonNegative(config.distance_sustain_seconds, "distance_sustain_seconds");
        requirePositive(config.distance_smoothing_alpha, "distance_smoothing_alpha");
        requireRange(config.distance_smoothing_alpha, 0.0, 1.0, "distance_smoothing_alpha");
        requireRange(config.eye_method_weight, 0.0, 1.0, "eye_method_weight");

        requireRange(config.pitch_threshold_down, -90.0, 90.0, "pitch_threshold_down");
        requireRange(config.pitch_threshold_up, -90.0, 90.0, "pitch_threshold_up");
        if (config.pitch_threshold_up >= config.pitch_threshold_down)
            throw ConfigError("Config: 'pitch_threshold_up' must be below 'pitch_threshold_down'");
        requireNonNegative(config.posture_sustain_seconds, "posture_sustain_seconds");
        if (config.posture_max_failed_frames < 1)
            throw ConfigError("Config: 'posture_max_failed_frames' must be >= 1");

        requireNonNegative(config.cooldown_time_seconds, "cooldown_time_seconds");
        if (config.enable_speech_alert && config.speech_command.empty())
            throw ConfigError("Config: 'speech_command' is required when speech alerts are enabled");
        if (config.led_gpio_pin < 0 || config.buzzer_gpio_pin < 0)
            throw ConfigError("Config: GPIO pins must be >= 0");

        if (config.camera_index < 0)
            throw ConfigError("Config: 'camera_index' must be >= 0");
        if (config.frame_width <= 0 || config.frame_height <= 0)
            throw ConfigError("Config: frame size must be positive");
        if (config.frame_skip < 1)
            throw ConfigError("Config: 'frame_skip' must be >= 1");
        if (config.camera_max_read_failures < 1)
            throw ConfigError("Config: 'camera_max_read_failures' must be >= 1");
        if (config.camera_unavailable_status_frames < 1)
            throw ConfigError("Config: 'camera_unavailable_status_frames' must be >= 1");
        if (config.detector_upsample < 0)
            throw ConfigError("Config: 'detector_upsample' must be >= 0");

        if (config.enable_publishing && config.zmq_endpoint.empty())
            throw ConfigError("Config: 'zmq_endpoint' is required when publishing is enabled");
        if (config.enable_file_logging && config.log_filename.empty())
            throw ConfigError("Config: 'log_filename' is required when file logging is enabled");
        parseLogLevel(config.console_log_level);
    }

    Config loadConfigFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw ConfigError("Config: cannot open '" + path + "'");

        nlohmann::json root;
        try
        {
            file >> root;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ConfigError("Config: failed to parse '" + path + "': " + e.what());
        }

        if (!root.is_object())
            throw ConfigError("Config: '" + path + "' must contain a JSON object");

        Config config;
        const auto &readers = fieldReaders();
        for (auto it = root.begin(); it != root.end(); ++it)
        {
            auto reader = readers.find(it.key());
            if (reader == readers.end())
                throw ConfigError("Config: unknown key '" + it.key() + "'");
            reader->second(config, it.value());
        }

        validateConfig(config);
        return config;
    }

    LogLevel parseLogLevel(const std::string &name)
    {
        if (name == "debug")
            return LogLevel::DEBUG;
        if (name == "info")
            return LogLevel::INFO;
        if (name == "warn")
            return LogLevel::WARN;
        if (name == "error")
            return LogLevel::ERROR;
        throw ConfigError("Config: unknown log level '" + name + "' (expected debug, info, warn or error)");
    }

    std::string logLevelToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }
}
