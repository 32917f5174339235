#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "protolink/schema/document.hpp"
#include "protolink/schema/message.hpp"
#include "protolink/schema/options.hpp"


namespace protolink::schema {

namespace compiler {

// ===============================================
// COMPILE RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Compiled,        // Schema produced (possibly with skipped files / routes)
    NotConfigured,   // No proto sources configured: feature disabled
    NoSources,       // Sources configured but no .proto file found
    SourceError      // Source directory could not be scanned
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Compiled:      return "Compiled";
        case Result::NotConfigured: return "NotConfigured";
        case Result::NoSources:     return "NoSources";
        case Result::SourceError:   return "SourceError";
        default:                    return "Unknown";
    }
}

} // namespace compiler


/*
================================================================================
Schema Compiler
================================================================================

Options -> source discovery -> grammar parser -> builder -> versioned Schema.

Each compile() call starts from an empty registry. Per-file failures are
logged and skipped; unresolved routes are logged and omitted. Only failures
that leave nothing to compile are reported through the result code, in which
case `out` is left untouched.
================================================================================
*/
class Compiler {
public:
    explicit Compiler(Options opts)
        : options_(std::move(opts))
    {}

    [[nodiscard]]
    compiler::Result compile(Schema& out);

    // Registry of the last compile() run
    [[nodiscard]] inline const Registry& messages() const noexcept { return messages_; }

    // Sources of the last compile() run, in processing order
    [[nodiscard]] inline const std::vector<std::string>& sources() const noexcept { return sources_; }

    // Number of sources of the last compile() run that could not be read
    [[nodiscard]] inline std::size_t failed_sources() const noexcept { return failed_sources_; }

    [[nodiscard]] inline const Options& options() const noexcept { return options_; }

    // Explicit files first (given order), then *.proto files found under
    // `opts.dir` in ascending path order.
    [[nodiscard]]
    static compiler::Result collect_sources(const Options& opts, std::vector<std::string>& out);

private:
    Options options_;
    Registry messages_;
    std::vector<std::string> sources_;
    std::size_t failed_sources_ = 0;
};

} // namespace protolink::schema
