#include "govee/lan/LanClient.h"
#include "govee/lan/LanConfig.h"

#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using json = nlohmann::json;

struct DaemonOptions {
    std::filesystem::path configPath;
    std::string listenAddress;
    std::int64_t scanPeriodMs{0};
    std::string logLevel;
    bool pollStatus{false};
    std::vector<std::string> sends;
};

// `<deviceId>=<json>`; the JSON is the inner `msg` object with cmd and data.
std::pair<std::string, json> parseSendArgument(const std::string& argument) {
    const auto pos = argument.find('=');
    if (pos == std::string::npos || pos == 0) {
        throw std::runtime_error("--send expects <deviceId>=<json>, got: " + argument);
    }
    auto params = json::parse(argument.substr(pos + 1), nullptr, false);
    if (params.is_discarded() || !params.is_object()) {
        throw std::runtime_error("--send payload must be a JSON object: " + argument);
    }
    if (!params.contains("cmd") || !params.at("cmd").is_string()) {
        throw std::runtime_error("--send payload needs a string 'cmd': " + argument);
    }
    return {argument.substr(0, pos), std::move(params)};
}

govee::lan::LanConfig buildConfig(const DaemonOptions& opts) {
    govee::lan::LanConfig config;
    if (!opts.configPath.empty()) {
        config = govee::lan::loadConfig(opts.configPath);
    }
    if (!opts.listenAddress.empty()) {
        config.listenAddress = opts.listenAddress;
    }
    if (opts.scanPeriodMs > 0) {
        config.scanPeriod = std::chrono::milliseconds(opts.scanPeriodMs);
    }
    if (!opts.logLevel.empty()) {
        config.logLevel = govee::lan::parseLogLevel(opts.logLevel);
    }
    govee::lan::validateConfig(config);
    return config;
}

// Runs once per scan period: pushes queued commands to devices that have
// shown up, and optionally polls every known device for its status.
class PeriodicTasks {
public:
    PeriodicTasks(boost::asio::io_context& ctx,
                  govee::lan::LanClient& client,
                  std::shared_ptr<spdlog::logger> logger,
                  std::map<std::string, json> pendingSends,
                  bool pollStatus)
        : timer_(ctx),
          client_(client),
          logger_(std::move(logger)),
          pendingSends_(std::move(pendingSends)),
          pollStatus_(pollStatus) {}

    void start() {
        running_ = true;
        schedule();
    }

    void stop() {
        running_ = false;
        timer_.cancel();
    }

private:
    void schedule() {
        timer_.expires_after(client_.config().scanPeriod);
        timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running_) {
                return;
            }
            tick();
            schedule();
        });
    }

    void tick() {
        for (auto it = pendingSends_.begin(); it != pendingSends_.end();) {
            if (!client_.registry().findById(it->first)) {
                ++it;
                continue;
            }
            govee::lan::AccessoryContext accessory;
            accessory.displayName = it->first;
            accessory.deviceId = it->first;
            accessory.enableDebugLogging = logger_->should_log(spdlog::level::debug);
            client_.updateDevice(accessory, it->second,
                                 [logger = logger_, id = it->first](const govee::lan::SendOutcome& outcome) {
                                     logger->info("[{}] [LAN] command {}", id, govee::lan::toString(outcome.status));
                                 });
            it = pendingSends_.erase(it);
        }

        if (pollStatus_) {
            for (const auto& device : client_.devices()) {
                client_.requestStatus(device.deviceId);
            }
        }
    }

    boost::asio::steady_timer timer_;
    govee::lan::LanClient& client_;
    std::shared_ptr<spdlog::logger> logger_;
    std::map<std::string, json> pendingSends_;
    bool pollStatus_{false};
    bool running_{false};
};

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"Govee LAN discovery and control daemon"};
    DaemonOptions opts;

    app.add_option("--config", opts.configPath, "YAML configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--listen", opts.listenAddress, "Local IPv4 address for the receiver socket");
    app.add_option("--scan-period", opts.scanPeriodMs, "Scan period in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", opts.logLevel, "trace, debug, info, warn, error, critical or off");
    app.add_flag("--poll-status", opts.pollStatus, "Request status from every known device each scan period");
    app.add_option("--send", opts.sends, "Command for a device once discovered: <deviceId>=<json>");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    auto logger = spdlog::stdout_color_mt("govee-lan");

    govee::lan::LanConfig config;
    std::map<std::string, json> pendingSends;
    try {
        config = buildConfig(opts);
        for (const auto& argument : opts.sends) {
            pendingSends.insert(parseSendArgument(argument));
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    logger->set_level(config.logLevel);

    try {
        boost::asio::io_context ioContext;
        govee::lan::LanClient client(ioContext, config, logger);
        client.setDeviceUpdateHandler([](const std::string& deviceId, const json& payload) {
            json line = {
                {"device", deviceId},
                {"msg", payload},
            };
            std::cout << line.dump() << std::endl;
        });

        PeriodicTasks tasks(ioContext, client, logger, std::move(pendingSends), opts.pollStatus);

        boost::asio::signal_set signals(ioContext, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) {
                return;
            }
            logger->info("Signal received, shutting down...");
            tasks.stop();
            client.stop();
        });

        if (!client.start()) {
            logger->warn("[LAN] receiver unavailable, scan replies will not be seen");
        }
        tasks.start();

        ioContext.run();
        logger->info("[LAN] stopped after {} scan(s), {} device(s) known",
                     client.scansSent(),
                     client.registry().size());
    } catch (const std::exception& ex) {
        logger->error("Fatal error: {}", ex.what());
        return 1;
    }

    return 0;
}
