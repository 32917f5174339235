#include "protolink/schema/compiler.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "protolink/config/protocol.hpp"
#include "protolink/schema/builder.hpp"
#include "protolink/schema/grammar/parser.hpp"
#include "lcr/log/logger.hpp"


namespace protolink::schema {

namespace fs = std::filesystem;

compiler::Result Compiler::collect_sources(const Options& opts, std::vector<std::string>& out) {
    std::vector<std::string> files(opts.files.begin(), opts.files.end());

    if (!opts.dir.empty()) {
        std::vector<std::string> found;
        std::error_code ec;
        fs::recursive_directory_iterator it(opts.dir, ec);
        const fs::recursive_directory_iterator end;
        while (!ec && it != end) {
            const auto& entry = *it;
            std::error_code type_ec;
            if (entry.is_regular_file(type_ec) && entry.path().extension() == config::PROTO_FILE_EXTENSION) {
                found.push_back(entry.path().string());
            }
            it.increment(ec);
        }
        if (ec) {
            PL_ERROR("[PROTO] Failed to scan proto directory '" << opts.dir << "': " << ec.message());
            return compiler::Result::SourceError;
        }
        std::sort(found.begin(), found.end());
        files.insert(files.end(), found.begin(), found.end());
    }

    out = std::move(files);
    return compiler::Result::Compiled;
}

compiler::Result Compiler::compile(Schema& out) {
    messages_.clear();
    sources_.clear();
    failed_sources_ = 0;

    if (!options_.has_proto_config()) {
        PL_DEBUG("[PROTO] No proto sources configured -> schema disabled");
        return compiler::Result::NotConfigured;
    }

    auto r = collect_sources(options_, sources_);
    if (r != compiler::Result::Compiled) {
        return r;
    }
    if (sources_.empty()) {
        PL_WARN("[PROTO] No proto files found");
        return compiler::Result::NoSources;
    }

    grammar::Parser parser;
    for (const auto& file : sources_) {
        if (parser.parse_file(file) != parser::Result::Parsed) {
            ++failed_sources_;
        }
    }
    messages_ = parser.release();

    if (failed_sources_ > 0) {
        PL_WARN("[PROTO] " << failed_sources_ << " of " << sources_.size() << " proto file(s) could not be read");
    }

    Builder builder(messages_);
    out = builder.build(options_);

    PL_INFO("[PROTO] Schema compiled: version=" << out.version
            << ", messages=" << messages_.size()
            << ", server routes=" << out.server.size()
            << ", client routes=" << out.client.size());
    return compiler::Result::Compiled;
}

} // namespace protolink::schema
