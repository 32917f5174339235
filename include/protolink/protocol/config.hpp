#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "protolink/config/protocol.hpp"
#include "protolink/schema/options.hpp"


namespace protolink::protocol {

// Route dictionary: route -> compressed route code
using Dictionary = std::map<std::string, std::uint32_t>;

// ===============================================
// COMMAND LAYER CONFIGURATION
// ===============================================
struct Config {
    std::chrono::seconds heartbeat = config::DEFAULT_HEARTBEAT;
    Dictionary dict{};
    std::string serializer{"protobuf"};
    schema::Options proto{};
};

} // namespace protolink::protocol
