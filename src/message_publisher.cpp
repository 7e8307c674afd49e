#include "../include/message_publisher.h"
#include "../include/constants.h"
#include "../include/logger.h"

namespace DeskMonitor
{
    MessagePublisher::MessagePublisher()
        : context_(nullptr),
          publisher_(nullptr),
          endpoint_(""),
          is_initialized_(false),
          messages_sent_(0),
          failed_sends_(0)
    {
    }

    MessagePublisher::~MessagePublisher()
    {
        shutdown();
    }

    bool MessagePublisher::initialize(const std::string &endpoint)
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);

        try
        {
            // Rebinding replaces the old socket
            if (is_initialized_)
                shutdownImpl();

            context_ = std::make_unique<zmq::context_t>(1);
            auto socket = std::make_unique<zmq::socket_t>(*context_, ZMQ_PUB);

            // Drop rather than queue old snapshots
            int linger_ms = Constants::PUBLISHER_LINGER_MS;
            int send_hwm = Constants::PUBLISHER_SEND_HWM;
            socket->setsockopt(ZMQ_LINGER, &linger_ms, sizeof(linger_ms));
            socket->setsockopt(ZMQ_SNDHWM, &send_hwm, sizeof(send_hwm));
            socket->bind(endpoint);

            publisher_ = std::move(socket);
            endpoint_ = endpoint;
            messages_sent_ = 0;
            failed_sends_ = 0;
            is_initialized_ = true;

            Logger::info("MessagePublisher", "bound to " + endpoint_);
            return true;
        }
        catch (const zmq::error_t &e)
        {
            Logger::error("MessagePublisher", std::string("ZeroMQ error during initialization: ") + e.what());
            publisher_.reset();
            context_.reset();
            is_initialized_ = false;
            return false;
        }
    }

    bool MessagePublisher::publish(const std::string &topic, const std::string &payload)
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);

        if (!is_initialized_ || !publisher_)
        {
            failed_sends_++;
            return false;
        }

        try
        {
            zmq::message_t topic_frame(topic.data(), topic.size());
            zmq::message_t payload_frame(payload.data(), payload.size());

            // Both frames are queued atomically by ZeroMQ, so only the first send can block
            zmq::send_result_t result = publisher_->send(topic_frame, zmq::send_flags::sndmore | zmq::send_flags::dontwait);
            if (!result.has_value())
            {
                failed_sends_++;
                Logger::warn("MessagePublisher", "send would block - message queue full");
                return false;
            }

            publisher_->send(payload_frame, zmq::send_flags::none);
            messages_sent_++;
            return true;
        }
        catch (const zmq::error_t &e)
        {
            failed_sends_++;
            Logger::error("MessagePublisher", std::string("ZeroMQ error during send: ") + e.what());
            return false;
        }
    }

    bool MessagePublisher::isReady() const
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        return is_initialized_ && publisher_ != nullptr;
    }

    void MessagePublisher::getStats(size_t &sent, size_t &failed) const
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        sent = messages_sent_;
        failed = failed_sends_;
    }

    void MessagePublisher::shutdown()
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        shutdownImpl();
    }

    void MessagePublisher::shutdownImpl()
    {
        if (!is_initialized_)
            return;

        try
        {
            if (publisher_)
            {
                publisher_->close();
                publisher_.reset();
            }

            if (context_)
            {
                context_->close();
                context_.reset();
            }
        }
        catch (const zmq::error_t &e)
        {
            Logger::error("MessagePublisher", std::string("error during shutdown: ") + e.what());
        }

        is_initialized_ = false;
        Logger::info("MessagePublisher", "shutdown complete. Sent: " + std::to_string(messages_sent_) +
                                             ", failed: " + std::to_string(failed_sends_));
    }
}
