#include "../include/logger.h"
#include "../include/constants.h"
#include "../include/metric_snapshot.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace DeskMonitor
{
    // Static member definitions
    std::unique_ptr<Logger> Logger::instance_ = nullptr;
    std::once_flag Logger::once_flag_;
    std::mutex Logger::instance_mutex_;

    LogEntry::LogEntry(const std::string &k, const std::string &lvl, const std::string &src, const std::string &msg)
        : timestamp(std::chrono::system_clock::now()), kind(k), level(lvl), source(src), message(msg) {}

    Logger &Logger::getInstance()
    {
        std::call_once(once_flag_, []()
                       { instance_ = std::unique_ptr<Logger>(new Logger()); });
        return *instance_;
    }

    void Logger::setupConfig(const Config &config)
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);

        if (is_initialized_)
        {
            std::cerr << "Warning: Logger already initialized. Config changes ignored." << "\n";
            return;
        }

        config_ = config;
        console_level_ = parseLogLevel(config_.console_log_level);
        should_stop_ = false;
        setupDirectories();

        if (config_.enable_file_logging)
        {
            worker_thread_ = std::thread(&Logger::processLogQueue, this);
        }

        is_initialized_ = true;
        writeImpl(LogLevel::INFO, "Logger", "initialized, console level " + logLevelToString(console_level_));
    }

    void Logger::logAlert(const AlertPayload &payload, const MetricSnapshot &snapshot)
    {
        Logger &logger = getInstance();
        if (!logger.is_initialized_)
            return;

        LogEntry entry("alert", severityToString(payload.severity), conditionToString(payload.condition),
                       payload.message);
        entry.has_metrics = true;
        entry.ear_value = snapshot.fatigue.ear_avg;
        entry.perclos_value = snapshot.fatigue.perclos;
        entry.distance_cm = snapshot.distance.smoothed_distance;
        entry.pitch_deg = snapshot.posture.pitch;

        logger.alerts_logged_++;
        if (logger.config_.enable_console_logging)
            logger.printToConsole(entry);
        logger.enqueue(entry);
    }

    void Logger::write(LogLevel level, const std::string &component, const std::string &message)
    {
        getInstance().writeImpl(level, component, message);
    }

    void Logger::debug(const std::string &component, const std::string &message)
    {
        write(LogLevel::DEBUG, component, message);
    }

    void Logger::info(const std::string &component, const std::string &message)
    {
        write(LogLevel::INFO, component, message);
    }

    void Logger::warn(const std::string &component, const std::string &message)
    {
        write(LogLevel::WARN, component, message);
    }

    void Logger::error(const std::string &component, const std::string &message)
    {
        write(LogLevel::ERROR, component, message);
    }

    void Logger::shutdown()
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (instance_ && instance_->is_initialized_)
        {
            instance_->shutdownImpl();
        }
    }

    Logger::~Logger()
    {
        if (is_initialized_)
        {
            shutdownImpl();
        }
    }

    void Logger::shutdownImpl()
    {
        should_stop_ = true;
        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
        is_initialized_ = false;

        std::cout << "Logger shutdown complete. Events written: " << total_events_logged_
                  << ", alerts: " << alerts_logged_ << "\n";
    }

    void Logger::writeImpl(LogLevel level, const std::string &component, const std::string &message)
    {
        if (!is_initialized_)
        {
            if (level >= LogLevel::WARN)
            {
                std::lock_guard<std::mutex> lock(console_mutex_);
                std::cerr << logLevelToString(level) << " | " << component << ": " << message << "\n";
            }
            return;
        }

        LogEntry entry("diagnostic", logLevelToString(level), component, message);

        if (config_.enable_console_logging && level >= console_level_)
            printToConsole(entry);

        // Only warnings and errors are kept in the event file
        if (level >= LogLevel::WARN)
            enqueue(entry);
    }

    void Logger::enqueue(const LogEntry &entry)
    {
        if (!config_.enable_file_logging)
            return;

        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(entry);

        // Prevent queue from growing too large
        while (log_queue_.size() > static_cast<size_t>(Constants::MAX_LOG_ENTRIES))
        {
            log_queue_.pop();
        }
    }

    void Logger::setupDirectories()
    {
        if (config_.enable_file_logging && !config_.log_path.empty() &&
            !std::filesystem::exists(config_.log_path))
        {
            std::filesystem::create_directories(config_.log_path);
        }
    }

    void Logger::printToConsole(const LogEntry &entry)
    {
        std::lock_guard<std::mutex> lock(console_mutex_);
        std::ostream &out = (entry.level == "ERROR" || entry.level == "WARN") ? std::cerr : std::cout;
        out << formatLogTimestamp(entry.timestamp)
            << " | " << entry.level
            << " | " << entry.source;
        if (entry.has_metrics)
        {
            out << " | EAR: " << std::fixed << std::setprecision(3) << entry.ear_value
                << " | PERCLOS: " << std::fixed << std::setprecision(3) << entry.perclos_value
                << " | Dist: " << std::fixed << std::setprecision(1) << entry.distance_cm
                << " | Pitch: " << std::fixed << std::setprecision(1) << entry.pitch_deg;
        }
        out << " | " << entry.message << "\n";
    }

    void Logger::processLogQueue()
    {
        std::ofstream log_file(config_.log_path + config_.log_filename, std::ios::app);
        if (!log_file.is_open())
        {
            std::lock_guard<std::mutex> lock(console_mutex_);
            std::cerr << "Logger: Cannot open " << config_.log_path + config_.log_filename << "\n";
        }

        while (true)
        {
            std::queue<LogEntry> temp_queue;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                temp_queue.swap(log_queue_);
            }

            while (!temp_queue.empty())
            {
                writeToFile(log_file, temp_queue.front());
                total_events_logged_++;
                temp_queue.pop();
            }
            log_file.flush();

            if (should_stop_)
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (log_queue_.empty())
                    break;
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    void Logger::getStats(size_t &events_logged, size_t &alerts_logged) const
    {
        events_logged = total_events_logged_;
        alerts_logged = alerts_logged_;
    }

    std::string Logger::formatLogTimestamp(const std::chrono::system_clock::time_point &tp)
    {
        std::time_t time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);
        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setw(3) << std::setfill('0') << ms.count();
        return ss.str();
    }

    std::string Logger::LogEntryToJsonString(const LogEntry &entry)
    {
        nlohmann::json log_json;
        log_json["timestamp"] = formatLogTimestamp(entry.timestamp);
        log_json["kind"] = entry.kind;
        log_json["level"] = entry.level;
        log_json["source"] = entry.source;
        log_json["message"] = entry.message;
        if (entry.has_metrics)
        {
            log_json["ear"] = entry.ear_value;
            log_json["perclos"] = entry.perclos_value;
            log_json["distance_cm"] = entry.distance_cm;
            log_json["pitch_deg"] = entry.pitch_deg;
        }
        return log_json.dump();
    }

    void Logger::writeToFile(std::ofstream &file, const LogEntry &entry)
    {
        if (!file.is_open())
            return;
        if (config_.enable_file_logging_json)
        {
            file << LogEntryToJsonString(entry) << "\n";
        }
        else
        {
            // Plain text log entry
            file << formatLogTimestamp(entry.timestamp)
                 << " | " << entry.kind
                 << " | " << entry.level
                 << " | " << entry.source;
            if (entry.has_metrics)
            {
                file << " | EAR: " << entry.ear_value
                     << " | PERCLOS: " << entry.perclos_value
                     << " | Dist: " << entry.distance_cm
                     << " | Pitch: " << entry.pitch_deg;
            }
            file << " | Message: " << entry.message << "\n";
        }
    }

}
