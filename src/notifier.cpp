#include "../include/notifier.h"
#include "../include/logger.h"
#include "../include/snapshot_json.h"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/wait.h>

namespace DeskMonitor
{
    bool ConsoleNotifier::notify(const AlertPayload &payload)
    {
        std::cout << "[ALERT][" << severityToString(payload.severity) << "] "
                  << conditionToString(payload.condition) << ": " << payload.message << std::endl;
        return !std::cout.fail();
    }

    SpeechNotifier::SpeechNotifier(const std::string &command) : command_(command) {}

    std::string SpeechNotifier::buildCommand(const std::string &message) const
    {
        std::string quoted = "'";
        for (char c : message)
        {
            if (c == '\'')
                quoted += "'\\''";
            else
                quoted += c;
        }
        quoted += "'";
        return command_ + " " + quoted;
    }

    bool SpeechNotifier::notify(const AlertPayload &payload)
    {
        int status = std::system(buildCommand(payload.message).c_str());
        if (status == -1)
        {
            Logger::warn("SpeechNotifier", "could not start '" + command_ + "'");
            return false;
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        {
            Logger::warn("SpeechNotifier", "'" + command_ + "' exited with status " + std::to_string(status));
            return false;
        }
        return true;
    }

    GpioNotifier::GpioNotifier(const Config &config, double time_scale)
        : sysfs_root_(config.gpio_sysfs_root),
          led_pin_(config.led_gpio_pin),
          buzzer_pin_(config.buzzer_gpio_pin),
          time_scale_(time_scale)
    {
    }

    GpioNotifier::BeepPattern GpioNotifier::patternFor(ConditionType condition)
    {
        switch (condition)
        {
        case ConditionType::FATIGUE_MICROSLEEP:
            return {{0.3, 0.1}, {0.3, 0.1}, {0.3, 0.1}, {0.3, 0.5}};
        case ConditionType::FATIGUE_LOW_BLINK:
        case ConditionType::FATIGUE_HIGH_BLINK:
        case ConditionType::FATIGUE_HIGH_PERCLOS:
            return {{0.1, 0.1}, {0.1, 0.1}, {0.1, 0.5}};
        case ConditionType::DISTANCE_TOO_CLOSE:
            return {{0.2, 0.2}, {0.2, 0.5}};
        case ConditionType::POSTURE_HEAD_DOWN:
        case ConditionType::POSTURE_HEAD_UP:
            return {{0.15, 0.15}, {0.15, 0.15}, {0.15, 0.5}};
        default:
            return {{0.2, 0.5}};
        }
    }

    std::string GpioNotifier::pinPath(int pin) const
    {
        return sysfs_root_ + "/gpio" + std::to_string(pin);
    }

    bool GpioNotifier::writeSysfs(const std::string &path, const std::string &value) const
    {
        std::ofstream file(path);
        if (!file.is_open())
            return false;
        file << value;
        file.flush();
        return !file.fail();
    }

    bool GpioNotifier::exportPin(int pin) const
    {
        if (!std::filesystem::exists(pinPath(pin)) &&
            !writeSysfs(sysfs_root_ + "/export", std::to_string(pin)))
        {
            Logger::warn("GpioNotifier", "cannot export GPIO " + std::to_string(pin));
            return false;
        }
        return writeSysfs(pinPath(pin) + "/direction", "out");
    }

    bool GpioNotifier::setPin(int pin, bool high) const
    {
        return writeSysfs(pinPath(pin) + "/value", high ? "1" : "0");
    }

    void GpioNotifier::wait(double seconds) const
    {
        if (time_scale_ <= 0.0)
            return;
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds * time_scale_));
    }

    bool GpioNotifier::notify(const AlertPayload &payload)
    {
        if (!exportPin(buzzer_pin_) || !exportPin(led_pin_))
            return false;

        bool ok = true;
        for (const auto &beep : patternFor(payload.condition))
        {
            ok = setPin(buzzer_pin_, true) && ok;
            wait(beep.first);
            ok = setPin(buzzer_pin_, false) && ok;
            wait(beep.second);
        }

        for (int i = 0; i < LED_BLINK_TIMES; ++i)
        {
            ok = setPin(led_pin_, true) && ok;
            wait(LED_BLINK_INTERVAL);
            ok = setPin(led_pin_, false) && ok;
            wait(LED_BLINK_INTERVAL);
        }

        if (!ok)
            Logger::warn("GpioNotifier", "GPIO write failed for " + conditionToString(payload.condition));
        return ok;
    }

    ZmqNotifier::ZmqNotifier(std::shared_ptr<MessagePublisher> publisher) : publisher_(std::move(publisher)) {}

    bool ZmqNotifier::notify(const AlertPayload &payload)
    {
        if (!publisher_ || !publisher_->isReady())
            return false;

        nlohmann::json alert_json = payload;
        return publisher_->publish(MessagePublisher::ALERT_TOPIC, alert_json.dump());
    }

    AsyncNotifier::AsyncNotifier(std::unique_ptr<Notifier> inner) : inner_(std::move(inner))
    {
        worker_thread_ = std::thread(&AsyncNotifier::processQueue, this);
    }

    AsyncNotifier::~AsyncNotifier()
    {
        shutdown();
    }

    std::string AsyncNotifier::name() const
    {
        return "async:" + inner_->name();
    }

    bool AsyncNotifier::notify(const AlertPayload &payload)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (should_stop_)
                return false;
            if (queue_.size() >= MAX_PENDING)
            {
                failed_++;
                Logger::warn("AsyncNotifier", inner_->name() + " backlog full, alert dropped");
                return false;
            }
            queue_.push(payload);
        }
        queue_cv_.notify_one();
        return true;
    }

    void AsyncNotifier::processQueue()
    {
        while (true)
        {
            AlertPayload payload;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this]()
                               { return should_stop_ || !queue_.empty(); });
                if (queue_.empty())
                    break;
                payload = queue_.front();
                queue_.pop();
                busy_ = true;
            }

            bool delivered = false;
            try
            {
                delivered = inner_->notify(payload);
                if (!delivered)
                    Logger::warn("AsyncNotifier", inner_->name() + " failed to deliver " +
                                                      conditionToString(payload.condition));
            }
            catch (const std::exception &e)
            {
                Logger::error("AsyncNotifier", inner_->name() + " threw: " + e.what());
            }
            if (delivered)
                delivered_++;
            else
                failed_++;

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                busy_ = false;
            }
            idle_cv_.notify_all();
        }
    }

    void AsyncNotifier::flush()
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        idle_cv_.wait(lock, [this]()
                      { return queue_.empty() && !busy_; });
    }

    void AsyncNotifier::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            should_stop_ = true;
        }
        queue_cv_.notify_all();
        if (worker_thread_.joinable())
            worker_thread_.join();
    }
}
