#ifndef NOTIFIER_H
#define NOTIFIER_H

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "alert_types.h"
#include "config.h"
#include "message_publisher.h"

namespace DeskMonitor
{
    /**
     * @brief One alert delivery channel.
     *
     * notify() returns false when delivery failed. Implementations may also
     * throw; the caller isolates each channel either way.
     */
    class Notifier
    {
    public:
        virtual ~Notifier() = default;
        virtual bool notify(const AlertPayload &payload) = 0;
        virtual std::string name() const = 0;
    };

    class ConsoleNotifier : public Notifier
    {
    public:
        bool notify(const AlertPayload &payload) override;
        std::string name() const override { return "console"; }
    };

    // Runs "<speech_command> '<message>'" through the shell
    class SpeechNotifier : public Notifier
    {
    private:
        std::string command_;

    public:
        explicit SpeechNotifier(const std::string &command);

        bool notify(const AlertPayload &payload) override;
        std::string name() const override { return "speech"; }

        // Full shell command for a message, single-quoted
        std::string buildCommand(const std::string &message) const;
    };

    /**
     * @brief LED and buzzer through the Linux sysfs GPIO interface.
     *
     * Blocks for the length of the beep pattern, so it is normally wrapped in
     * an AsyncNotifier.
     */
    class GpioNotifier : public Notifier
    {
    public:
        using BeepPattern = std::vector<std::pair<double, double>>; // (on, off) seconds

    private:
        std::string sysfs_root_;
        int led_pin_;
        int buzzer_pin_;
        double time_scale_;

        std::string pinPath(int pin) const;
        bool writeSysfs(const std::string &path, const std::string &value) const;
        bool exportPin(int pin) const;
        bool setPin(int pin, bool high) const;
        void wait(double seconds) const;

    public:
        static constexpr int LED_BLINK_TIMES = 3;
        static constexpr double LED_BLINK_INTERVAL = 0.5;

        // time_scale multiplies every on/off interval; 0 drives the pins without waiting
        GpioNotifier(const Config &config, double time_scale = 1.0);

        bool notify(const AlertPayload &payload) override;
        std::string name() const override { return "gpio"; }

        static BeepPattern patternFor(ConditionType condition);
    };

    // Publishes the alert on the shared PUB socket under the "alert" topic
    class ZmqNotifier : public Notifier
    {
    private:
        std::shared_ptr<MessagePublisher> publisher_;

    public:
        explicit ZmqNotifier(std::shared_ptr<MessagePublisher> publisher);

        bool notify(const AlertPayload &payload) override;
        std::string name() const override { return "zmq"; }
    };

    /**
     * @brief Moves a slow channel onto its own worker thread.
     *
     * notify() only queues the payload. Failures of the wrapped channel are
     * logged and counted on the worker.
     */
    class AsyncNotifier : public Notifier
    {
    private:
        std::unique_ptr<Notifier> inner_;
        std::queue<AlertPayload> queue_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::thread worker_thread_;
        bool should_stop_ = false;
        bool busy_ = false;
        std::condition_variable idle_cv_;
        std::atomic<size_t> delivered_{0};
        std::atomic<size_t> failed_{0};

        static constexpr size_t MAX_PENDING = 16;

        void processQueue();

    public:
        explicit AsyncNotifier(std::unique_ptr<Notifier> inner);
        ~AsyncNotifier() override;

        bool notify(const AlertPayload &payload) override;
        std::string name() const override;

        // Blocks until every queued payload has been handed to the wrapped channel
        void flush();
        void shutdown();

        size_t deliveredCount() const { return delivered_; }
        size_t failedCount() const { return failed_; }

        AsyncNotifier(const AsyncNotifier &) = delete;
        AsyncNotifier &operator=(const AsyncNotifier &) = delete;
    };
}

#endif // NOTIFIER_H
