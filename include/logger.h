#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <chrono>
#include <queue>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <fstream>
#include "alert_types.h"
#include "config.h"

namespace DeskMonitor
{
    struct MetricSnapshot;

    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        std::string kind;   // "alert" or "diagnostic"
        std::string level;  // alert severity or log level
        std::string source; // condition name or component
        std::string message;
        bool has_metrics = false;
        double ear_value = 0.0;
        double perclos_value = 0.0;
        double distance_cm = 0.0;
        double pitch_deg = 0.0;
        LogEntry(const std::string &k, const std::string &lvl, const std::string &src, const std::string &msg);
    };

    class Logger
    {
    private:
        // Static members for singleton
        static std::unique_ptr<Logger> instance_;
        static std::once_flag once_flag_;
        static std::mutex instance_mutex_;

        // Statistics
        std::atomic<size_t> total_events_logged_;
        std::atomic<size_t> alerts_logged_;

        // Instance members
        std::queue<LogEntry> log_queue_;
        std::mutex queue_mutex_;
        std::mutex console_mutex_;
        std::thread worker_thread_;
        std::atomic<bool> should_stop_{false};
        Config config_;
        LogLevel console_level_ = LogLevel::INFO;
        std::atomic<bool> is_initialized_{false};

        Logger() : total_events_logged_(0), alerts_logged_(0) {}

        // Delete copy constructor and assignment operator
        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        // Delete move constructor and assignment operator
        Logger(Logger &&) = delete;
        Logger &operator=(Logger &&) = delete;

    public:
        static Logger &getInstance();

        // Setup configuration - must be called before alerts are written to file
        void setupConfig(const Config &config);

        static void logAlert(const AlertPayload &payload, const MetricSnapshot &snapshot);

        // Diagnostics. Before setupConfig only warnings and errors are printed (to stderr)
        static void write(LogLevel level, const std::string &component, const std::string &message);
        static void debug(const std::string &component, const std::string &message);
        static void info(const std::string &component, const std::string &message);
        static void warn(const std::string &component, const std::string &message);
        static void error(const std::string &component, const std::string &message);

        void getStats(size_t &events_logged, size_t &alerts_logged) const;

        // Static shutdown method
        static void shutdown();

        // Destructor
        ~Logger();

    private:
        void shutdownImpl();
        void writeImpl(LogLevel level, const std::string &component, const std::string &message);
        void enqueue(const LogEntry &entry);

        void setupDirectories();
        void printToConsole(const LogEntry &entry);
        void processLogQueue();
        std::string LogEntryToJsonString(const LogEntry &entry);
        void writeToFile(std::ofstream &file, const LogEntry &entry);
        std::string formatLogTimestamp(const std::chrono::system_clock::time_point &tp);
    };
}

#endif // LOGGER_H
