#pragma once

#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "protolink/parser/result.hpp"
#include "protolink/schema/message.hpp"
#include "protolink/schema/grammar/line.hpp"


namespace protolink::schema::grammar {

/*
================================================================================
IDL Grammar Parser
================================================================================

Single forward pass over the lines of each source, feeding one shared message
registry:

  • Blank lines and full-line // comments are skipped
  • A message header starts a new accumulator (an unfinished one is dropped);
    depth starts at the header's brace balance, or 1 when the '{' is expected
    on a following line (that first '{' is then not counted again)
  • Inside a body every line updates the depth; map fields are desugared into
    a synthetic <Owner>_<field>Entry message, plain fields are appended
  • Depth <= 0 finalizes the message (last definition of a name wins)
  • Fields outside a message body are ignored
  • A body still open at end of input is discarded

Parsing is best-effort per source: an unreadable file is reported to the
caller and does not affect the registry state built from other sources.
================================================================================
*/

class Parser {
public:
    Parser() = default;

    // Parses one source file. Returns IoError when the file cannot be opened
    // or read; messages finalized before a read failure are kept.
    [[nodiscard]]
    parser::Result parse_file(const std::string& path);

    // Parses an in-memory source (origin is only used for diagnostics).
    void parse_text(std::string_view text, std::string_view origin = "<memory>");

    [[nodiscard]]
    inline const Registry& messages() const noexcept {
        return registry_;
    }

    [[nodiscard]]
    inline Registry release() noexcept {
        return std::move(registry_);
    }

private:
    [[nodiscard]]
    bool parse_stream_(std::istream& in, std::string_view origin);

    void begin_source_() noexcept;
    void end_source_(std::string_view origin);

    void parse_line_(std::string_view line);

    void add_map_field_(const LineMatch& m);
    void add_field_(const LineMatch& m);

private:
    Registry registry_;

    // Per-source scanning state
    std::optional<Message> current_;
    int depth_ = 0;
    bool awaiting_open_ = false;   // header seen, '{' expected on a later line
};

} // namespace protolink::schema::grammar
