#include "govee/lan/Protocol.h"

#include <utility>

namespace govee::lan {

namespace {

using json = nlohmann::json;

std::string requireString(const json& data, const char* field) {
    auto it = data.find(field);
    if (it == data.end()) {
        throw ProtocolError(std::string("scan reply missing '") + field + "'");
    }
    if (!it->is_string()) {
        throw ProtocolError(std::string("scan reply field '") + field + "' must be a string");
    }
    return it->get<std::string>();
}

}  // namespace

const nlohmann::json& Envelope::data() const {
    static const json kEmpty = json::object();
    auto it = msg.find("data");
    if (it == msg.end()) {
        return kEmpty;
    }
    return *it;
}

std::string makeScanRequest() {
    json request = {
        {"msg", {
            {"cmd", command::kScan},
            {"data", {{"account_topic", kScanAccountTopic}}},
        }},
    };
    return request.dump();
}

std::string makeStatusRequest() {
    json request = {
        {"msg", {
            {"cmd", command::kDeviceStatus},
            {"data", json::object()},
        }},
    };
    return request.dump();
}

std::string wrapCommand(const nlohmann::json& params) {
    json envelope = json::object();
    envelope["msg"] = params;
    return envelope.dump();
}

Envelope parseEnvelope(std::string_view datagram) {
    json root = json::parse(datagram.begin(), datagram.end(), nullptr, false);
    if (root.is_discarded()) {
        throw ProtocolError("datagram is not valid JSON");
    }
    if (!root.is_object()) {
        throw ProtocolError("datagram root must be an object");
    }

    auto msgIt = root.find("msg");
    if (msgIt == root.end() || !msgIt->is_object()) {
        throw ProtocolError("envelope missing 'msg' object");
    }
    auto cmdIt = msgIt->find("cmd");
    if (cmdIt == msgIt->end() || !cmdIt->is_string()) {
        throw ProtocolError("envelope missing 'msg.cmd' string");
    }

    Envelope envelope;
    envelope.cmd = cmdIt->get<std::string>();
    envelope.msg = std::move(*msgIt);
    return envelope;
}

DeviceRecord parseScanReply(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ProtocolError("scan reply 'data' must be an object");
    }
    DeviceRecord record;
    record.deviceId = requireString(data, "device");
    record.sku = requireString(data, "sku");
    record.ip = requireString(data, "ip");
    record.attributes = data;
    return record;
}

}  // namespace govee::lan
