#include "protolink/schema/version.hpp"

#include <exception>
#include <string>

#include <xxhash.h>

#include "protolink/config/protocol.hpp"
#include "lcr/log/logger.hpp"


namespace protolink::schema::version {

std::int64_t checksum(std::string_view bytes) noexcept {
    const XXH32_hash_t hash = XXH32(bytes.data(), bytes.size(), 0);
    return static_cast<std::int64_t>(hash & 0x7FFFFFFFu);
}

std::int64_t compute(const Schema& schema) {
    std::string payload;
    try {
        payload = to_content_json(schema);
    }
    catch (const std::exception& e) {
        PL_WARN("[PROTO] Schema version hashing failed, using default version "
                << config::FALLBACK_SCHEMA_VERSION << ": " << e.what());
        return config::FALLBACK_SCHEMA_VERSION;
    }
    const std::int64_t version = checksum(payload);
    PL_INFO("[PROTO] Schema version derived from content: " << version << " (" << payload.size() << " bytes hashed)");
    return version;
}

} // namespace protolink::schema::version
