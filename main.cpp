#include "include/monitor_pipeline.h"
#include "include/logger.h"
#include "include/config.h"
#include "include/message_publisher.h"
#include "include/notifier.h"
#include "include/presentation.h"
#include <csignal>
#include <iostream>
#include <memory>

namespace
{
    DeskMonitor::MonitorPipeline *active_pipeline = nullptr;

    void handleSignal(int)
    {
        if (active_pipeline)
            active_pipeline->stop();
    }

    void attachChannels(DeskMonitor::MonitorPipeline &pipeline, const DeskMonitor::Config &config)
    {
        using namespace DeskMonitor;

        if (config.enable_publishing)
        {
            auto publisher = std::make_shared<MessagePublisher>();
            if (publisher->initialize(config.zmq_endpoint))
            {
                pipeline.addSink(std::make_shared<ZmqSnapshotSink>(publisher));
                pipeline.addNotifier(std::make_shared<ZmqNotifier>(publisher));
            }
            else
            {
                Logger::warn("main", "publishing disabled, could not bind " + config.zmq_endpoint);
            }
        }

        if (config.enable_console_alert)
            pipeline.addNotifier(std::make_shared<ConsoleNotifier>());

        // Speech and GPIO block for seconds, keep them off the frame loop
        if (config.enable_speech_alert)
            pipeline.addNotifier(std::make_shared<AsyncNotifier>(std::make_unique<SpeechNotifier>(config.speech_command)));

        if (config.enable_gpio_alert)
            pipeline.addNotifier(std::make_shared<AsyncNotifier>(std::make_unique<GpioNotifier>(config)));

        if (config.show_window)
            pipeline.addSink(std::make_shared<OverlayRenderer>(config));
    }
}

int main(int argc, char **argv)
{
    try
    {
        // Defaults, or a JSON file of overrides
        DeskMonitor::Config config;
        if (argc > 1)
            config = DeskMonitor::loadConfigFile(argv[1]);
        else
            DeskMonitor::validateConfig(config);

        // Initialize logger with configuration
        DeskMonitor::Logger::getInstance().setupConfig(config);

        auto source = std::make_unique<DeskMonitor::VideoCaptureSource>(config);
        if (!source->open())
        {
            std::cerr << "Failed to open video source" << std::endl;
            return -1;
        }

        auto detector = std::make_unique<DeskMonitor::DlibLandmarkDetector>();
        if (!detector->initialize(config.model_path, config.detector_upsample))
        {
            std::cerr << "Failed to load landmark model: " << config.model_path << std::endl;
            return -1;
        }

        DeskMonitor::MonitorPipeline pipeline(config, std::move(source), std::move(detector));
        attachChannels(pipeline, config);

        active_pipeline = &pipeline;
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        std::cout << "Desk Monitor started" << std::endl;
        std::cout << "Press ESC or Ctrl+C to exit" << std::endl;

        int result = pipeline.run();
        active_pipeline = nullptr;
        return result;
    }
    catch (const DeskMonitor::ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return -1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return -1;
    }
    catch (...)
    {
        std::cerr << "Unknown fatal error occurred" << std::endl;
        return -1;
    }
}
