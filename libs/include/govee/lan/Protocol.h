#pragma once

#include "govee/lan/DeviceRegistry.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace govee::lan {

namespace command {
inline constexpr const char* kScan = "scan";
inline constexpr const char* kDeviceStatus = "devStatus";
}  // namespace command

inline constexpr const char* kLanSource = "LAN";
inline constexpr const char* kScanAccountTopic = "reserve";

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Decoded `{"msg": {...}}` envelope. `msg` is the full inner object, so any
// sibling of `cmd` and `data` survives the round trip to the owner.
struct Envelope {
    std::string cmd;
    nlohmann::json msg;

    const nlohmann::json& data() const;
};

std::string makeScanRequest();
std::string makeStatusRequest();

// Serializes `{"msg": params}`. `params` carries its own `cmd` and `data`.
std::string wrapCommand(const nlohmann::json& params);

Envelope parseEnvelope(std::string_view datagram);

DeviceRecord parseScanReply(const nlohmann::json& data);

}  // namespace govee::lan
