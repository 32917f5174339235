#pragma once

#include <cstdint>
#include <string_view>

#include "protolink/schema/document.hpp"


namespace protolink::schema::version {

// 31-bit non-negative checksum (XXH32, seed 0, sign bit masked off).
// Not CRC32: versions differ from a CRC32-IEEE based server for the same
// content. Clients only echo the value back, so only determinism matters.
[[nodiscard]]
std::int64_t checksum(std::string_view bytes) noexcept;

// Content-derived schema version: checksum of to_content_json(schema).
// `schema.version` itself is not part of the hashed payload, so identical
// server/client/messages content always yields the same version.
// Falls back to config::FALLBACK_SCHEMA_VERSION if serialization fails.
[[nodiscard]]
std::int64_t compute(const Schema& schema);

} // namespace protolink::schema::version
