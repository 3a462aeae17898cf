#include "govee/lan/LanClient.h"

#include "TestSupport.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using govee::lan::SendOutcome;
using govee::lan::SendStatus;
using govee::lan::testing::CapturingLogger;
using govee::lan::testing::FakeDatagramSender;
using govee::lan::testing::endpointOf;

namespace {

govee::lan::LanConfig testConfig() {
    govee::lan::LanConfig config;
    config.statusDelay = std::chrono::milliseconds(20);
    config.scanPeriod = std::chrono::milliseconds(1000);
    return config;
}

std::string scanReply(const std::string& device, const std::string& ip) {
    return json{{"msg", {{"cmd", "scan"}, {"data", {{"device", device}, {"sku", "H6072"}, {"ip", ip}}}}}}.dump();
}

govee::lan::AccessoryContext accessoryFor(const std::string& deviceId) {
    govee::lan::AccessoryContext accessory;
    accessory.displayName = "Desk Lamp";
    accessory.deviceId = deviceId;
    return accessory;
}

const json kBrightness = {{"cmd", "brightness"}, {"data", {{"value", 50}}}};

}  // namespace

TEST_CASE("updateDevice requests status after the configured delay", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);
    govee::lan::LanClient client(ctx, testConfig(), log.logger, transport);

    client.handleDatagram(scanReply("lamp", "192.168.1.50"), endpointOf("192.168.1.50"));
    REQUIRE(client.devices().size() == 1);

    std::optional<SendOutcome> result;
    client.updateDevice(accessoryFor("lamp"), kBrightness, [&result](const SendOutcome& outcome) { result = outcome; });
    ctx.run();

    REQUIRE(result.has_value());
    CHECK(result->ok());
    REQUIRE(transport.sent.size() == 2);
    CHECK(json::parse(transport.sent[0].payload).at("msg") == kBrightness);
    CHECK(json::parse(transport.sent[1].payload).at("msg").at("cmd") == "devStatus");
    CHECK(transport.sent[1].destination == endpointOf("192.168.1.50", 4003));
    CHECK(transport.sent[1].at - transport.sent[0].at >= std::chrono::milliseconds(20));
}

TEST_CASE("Status refresh delivers the device reply to the owner", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);
    govee::lan::LanClient client(ctx, testConfig(), log.logger, transport);

    std::vector<std::string> updatedIds;
    client.setDeviceUpdateHandler([&updatedIds](const std::string& deviceId, const json& payload) {
        CHECK(payload.at("source") == "LAN");
        updatedIds.push_back(deviceId);
    });

    transport.onSend = [&](const FakeDatagramSender::Sent& sent) {
        if (json::parse(sent.payload).at("msg").at("cmd") == "devStatus") {
            client.handleDatagram(R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":50}}})",
                                  endpointOf(sent.destination.address().to_string()));
        }
    };

    client.handleDatagram(scanReply("lamp", "192.168.1.50"), endpointOf("192.168.1.50"));
    client.updateDevice(accessoryFor("lamp"), kBrightness);
    ctx.run();

    CHECK(updatedIds == std::vector<std::string>{"lamp"});
}

TEST_CASE("Failed updates evict and skip the status refresh", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);
    transport.unreachable.insert("192.168.1.50");
    govee::lan::LanClient client(ctx, testConfig(), log.logger, transport);

    client.handleDatagram(scanReply("lamp", "192.168.1.50"), endpointOf("192.168.1.50"));

    std::optional<SendOutcome> result;
    client.updateDevice(accessoryFor("lamp"), kBrightness, [&result](const SendOutcome& outcome) { result = outcome; });
    ctx.run();

    REQUIRE(result.has_value());
    CHECK(result->status == SendStatus::TransportError);
    CHECK(transport.sent.size() == 1);
    CHECK(client.registry().empty());

    SECTION("rediscovery makes the device reachable again") {
        ctx.restart();
        transport.unreachable.clear();
        client.handleDatagram(scanReply("lamp", "192.168.1.51"), endpointOf("192.168.1.51"));
        client.updateDevice(accessoryFor("lamp"), kBrightness);
        ctx.run();
        REQUIRE(transport.sent.size() == 3);
        CHECK(transport.sent[2].destination == endpointOf("192.168.1.51", 4003));
    }
}

TEST_CASE("stop cancels pending status refreshes", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);
    govee::lan::LanClient client(ctx, testConfig(), log.logger, transport);

    client.handleDatagram(scanReply("lamp", "192.168.1.50"), endpointOf("192.168.1.50"));
    std::optional<SendOutcome> result;
    client.updateDevice(accessoryFor("lamp"), kBrightness, [&result](const SendOutcome& outcome) { result = outcome; });

    SECTION("after the control send completed") {
        ctx.poll();
        client.stop();
        ctx.run();
    }

    SECTION("while the control send is still queued") {
        client.stop();
        ctx.run();
    }

    REQUIRE(result.has_value());
    CHECK(result->ok());
    CHECK(transport.sent.size() == 1);
}

TEST_CASE("A started client sends no status request after stop", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);
    auto config = testConfig();
    config.listenAddress = "127.0.0.1";
    config.receiverPort = 0;
    govee::lan::LanClient client(ctx, config, log.logger, transport);

    client.start();
    client.handleDatagram(scanReply("lamp", "192.168.1.50"), endpointOf("192.168.1.50"));
    client.updateDevice(accessoryFor("lamp"), kBrightness);
    client.stop();
    ctx.run();

    REQUIRE(transport.sent.size() == 2);
    CHECK(json::parse(transport.sent[0].payload).at("msg").at("cmd") == "scan");
    CHECK(json::parse(transport.sent[1].payload).at("msg") == kBrightness);

    SECTION("restarting enables status refreshes again") {
        ctx.restart();
        transport.onSend = [&](const FakeDatagramSender::Sent& sent) {
            if (json::parse(sent.payload).at("msg").at("cmd") == "devStatus") {
                client.stop();
            }
        };
        client.start();
        client.updateDevice(accessoryFor("lamp"), kBrightness);
        ctx.run();
        REQUIRE(transport.sent.size() == 5);
        CHECK(json::parse(transport.sent[4].payload).at("msg").at("cmd") == "devStatus");
    }
}

TEST_CASE("Destroying the client drops completions still queued", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);
    std::optional<SendOutcome> result;

    SECTION("successful send") {
        auto client = std::make_unique<govee::lan::LanClient>(ctx, testConfig(), log.logger, transport);
        client->handleDatagram(scanReply("lamp", "192.168.1.50"), endpointOf("192.168.1.50"));
        client->updateDevice(accessoryFor("lamp"), kBrightness, [&result](const SendOutcome& outcome) { result = outcome; });
        client.reset();
    }

    SECTION("failed send") {
        transport.unreachable.insert("192.168.1.50");
        auto client = std::make_unique<govee::lan::LanClient>(ctx, testConfig(), log.logger, transport);
        client->handleDatagram(scanReply("lamp", "192.168.1.50"), endpointOf("192.168.1.50"));
        client->updateDevice(accessoryFor("lamp"), kBrightness, [&result](const SendOutcome& outcome) { result = outcome; });
        client.reset();
    }

    ctx.run();

    CHECK_FALSE(result.has_value());
    CHECK(transport.sent.size() == 1);
    CHECK(log.count("info", "command sent") == 0);
    CHECK(log.count("info", "removed device") == 0);
}

TEST_CASE("requestStatus reports unknown devices without traffic", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);
    govee::lan::LanClient client(ctx, testConfig(), log.logger, transport);

    std::optional<SendOutcome> result;
    client.requestStatus("ghost", [&result](const SendOutcome& outcome) { result = outcome; });

    REQUIRE(result.has_value());
    CHECK(result->status == SendStatus::DeviceNotFound);
    CHECK(transport.sent.empty());
}

TEST_CASE("LanClient rejects an unusable configuration", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);

    auto config = testConfig();
    config.multicastAddress = "192.168.1.1";
    CHECK_THROWS_AS(govee::lan::LanClient(ctx, config, log.logger, transport), std::runtime_error);
}

TEST_CASE("start scans immediately and stop lets the loop drain", "[client]") {
    boost::asio::io_context ctx;
    CapturingLogger log;
    FakeDatagramSender transport(ctx);
    auto config = testConfig();
    config.listenAddress = "127.0.0.1";
    config.receiverPort = 0;
    govee::lan::LanClient client(ctx, config, log.logger, transport);

    client.start();
    REQUIRE(client.scansSent() == 1);
    REQUIRE(transport.sent.size() == 1);
    CHECK(transport.sent[0].destination == endpointOf("239.255.255.250", 4001));

    client.stop();
    ctx.run();
    CHECK_FALSE(client.listening());
    CHECK(transport.sent.size() == 1);
}
