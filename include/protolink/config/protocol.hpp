#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>


namespace protolink::config {

/*
===============================================================================
Protocol constants
===============================================================================

Compile-time defaults shared by the schema compiler and the session command
layer. No magic numbers scattered across the codebase.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Session
// -----------------------------------------------------------------------------
inline constexpr std::chrono::seconds DEFAULT_HEARTBEAT{60};

inline constexpr int HANDSHAKE_OK_CODE = 200;

// -----------------------------------------------------------------------------
// Packet framing: 1 byte type + 3 bytes big-endian body length
// -----------------------------------------------------------------------------
inline constexpr std::size_t PACKET_HEADER_SIZE   = 4;
inline constexpr std::size_t PACKET_MAX_BODY_SIZE = (1u << 24) - 1; // 16 MB - 1

// -----------------------------------------------------------------------------
// Schema compiler
// -----------------------------------------------------------------------------
inline constexpr std::string_view PROTO_FILE_EXTENSION = ".proto";

// Reserved key holding nested message definitions inside a route schema,
// and the top-level dictionary key in global-message mode.
inline constexpr std::string_view MESSAGES_KEY = "__messages__";

// Minimum depth cap for nested message collection. The effective cap grows
// with the registry size (cycles are already cut by the visited set).
inline constexpr std::size_t MAX_NESTED_DEPTH = 64;

// Version used when the content hash cannot be computed
inline constexpr std::int64_t FALLBACK_SCHEMA_VERSION = 1;

} // namespace protolink::config
