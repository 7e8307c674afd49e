#pragma once

#include <zmq.hpp>
#include <string>
#include <memory>
#include <mutex>

namespace DeskMonitor
{
    /**
     * @brief ZeroMQ PUB socket shared by the snapshot sink and the alert notifier
     *
     * Every message goes out as two frames: [topic, json]. Subscribers filter
     * on the topic frame ("snapshot" or "alert").
     */
    class MessagePublisher
    {
    private:
        std::unique_ptr<zmq::context_t> context_;
        std::unique_ptr<zmq::socket_t> publisher_;
        std::string endpoint_;
        bool is_initialized_;
        mutable std::mutex publisher_mutex_;

        // Statistics for monitoring
        size_t messages_sent_;
        size_t failed_sends_;

        void shutdownImpl();

    public:
        static constexpr const char *SNAPSHOT_TOPIC = "snapshot";
        static constexpr const char *ALERT_TOPIC = "alert";

        MessagePublisher();
        ~MessagePublisher();

        /**
         * @brief Bind the PUB socket
         * @param endpoint ZeroMQ endpoint (e.g., "tcp://*:5555" or "ipc:///tmp/desk_monitor")
         * @return true if successful, false otherwise
         */
        bool initialize(const std::string &endpoint);

        /**
         * @brief Publish one [topic, payload] message without blocking
         * @return false when not initialized or the send queue is full
         */
        bool publish(const std::string &topic, const std::string &payload);

        bool isReady() const;

        void getStats(size_t &sent, size_t &failed) const;

        void shutdown();

        // Delete copy constructor and assignment operator
        MessagePublisher(const MessagePublisher &) = delete;
        MessagePublisher &operator=(const MessagePublisher &) = delete;
    };
}
