#include "config/ConfigLoader.hpp"
#include "RampartErrors.hpp"
#include "RampartLogging.hpp"
#include "runtime/RampartRuntime.hpp"
#include "status/StatusJson.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <csignal>
#include <exception>
#include <functional>

using namespace Rampart;

int main(int argc, char** argv) {
    RampartConfig config;
    try {
        if (auto path = ConfigLoader::resolvePath(argc, argv)) {
            LOG_I("App", "Loading configuration from {}", *path);
            config = ConfigLoader::loadFile(*path);
        } else {
            LOG_I("App", "No configuration given, using built-in defaults");
        }
    } catch (const ConfigError& e) {
        rLog_Error("Configuration rejected: {}", e.what());
        return 2;
    }

    std::unique_ptr<RampartRuntime> runtime;
    try {
        runtime = std::make_unique<RampartRuntime>(std::move(config));
        runtime->start();
    } catch (const ConfigError& e) {
        rLog_Error("Configuration rejected: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        rLog_Error("Startup failed: {}", e.what());
        return 1;
    }

    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    boost::asio::steady_timer statusTimer(ioc);
    const auto interval = runtime->config().runtime.statusInterval;
    bool stopping = false;

    std::function<void()> scheduleStatus = [&] {
        statusTimer.expires_after(interval);
        statusTimer.async_wait([&](const boost::system::error_code& ec) {
            if (ec || stopping) return;
            LOG_I("App", "status {}", toJson(runtime->status()).dump());
            scheduleStatus();
        });
    };

    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        LOG_I("App", "Received signal {}, shutting down", signo);
        stopping = true;
        statusTimer.cancel();
    });

    scheduleStatus();
    ioc.run();

    runtime->stop();
    LOG_I("App", "final status {}", toJson(runtime->status()).dump());
    return 0;
}
