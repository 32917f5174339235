#include <cstdlib>
#include <fstream>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "protolink.hpp"
#include "protolink/protocol/handshake.hpp"
#include "protolink/protocol/packet.hpp"

using namespace protolink;
using namespace lcr::log;

// -----------------------------------------------------------------------------
// route=Message helpers
// -----------------------------------------------------------------------------
static bool split_route_(const std::string& value, std::string& route, std::string& message) {
    const auto eq = value.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == value.size()) {
        return false;
    }
    route = value.substr(0, eq);
    message = value.substr(eq + 1);
    return true;
}

static std::size_t framed_size_(std::string_view body) {
    protocol::packet::Codec codec;
    protocol::Bytes out;
    const std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(body.data()), body.size());
    if (codec.encode(protocol::packet::Type::Handshake, bytes, out) != protocol::packet::Error::None) {
        return 0;
    }
    return out.size();
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    CLI::App app{"protolink - Proto Schema Compiler\n"
        "Compiles message definitions into the route schema sent to clients during the handshake.\n"};

    std::string config_path;
    std::vector<std::string> files;
    std::string dir;
    std::int64_t version = 0;
    bool global_messages = false;
    std::vector<std::string> server_routes;
    std::vector<std::string> client_routes;
    std::string output;
    std::string log_level = "info";

    auto route_validator = CLI::Validator(
        [](std::string& value) -> std::string {
            std::string route, message;
            if (split_route_(value, route, message)) {
                return {}; // OK
            }
            return "Route mapping must be in format route=Message (e.g. game.room.join=JoinRequest)";
        },
        "Route mapping validator"
    );

    app.add_option("-c,--config", config_path, "JSON configuration file")->check(CLI::ExistingFile);
    app.add_option("-f,--file", files, "Proto file(s), repeatable");
    app.add_option("-d,--dir", dir, "Directory scanned recursively for .proto files");
    app.add_option("--version", version, "Schema version (0 = derived from content)")->check(CLI::NonNegativeNumber);
    app.add_flag("--global-messages", global_messages, "Emit nested messages once in a global dictionary");
    app.add_option("-s,--server", server_routes, "Server route mapping(s), repeatable (e.g. -s game.room.join=JoinResponse)")->check(route_validator);
    app.add_option("-C,--client", client_routes, "Client route mapping(s), repeatable (e.g. -C game.room.join=JoinRequest)")->check(route_validator);
    app.add_option("-o,--output", output, "Write the schema JSON to this file instead of stdout");
    app.add_option("-l,--log-level", log_level, "Log level: trace | debug | info | warn | error")->default_val(log_level);
    app.footer(
        "Command line values override the configuration file.\n"
        "Routes whose message is not defined are reported and skipped.\n"
        "Logs and diagnostics go to stderr; stdout carries only the schema document."
    );

    CLI11_PARSE(app, argc, argv);

    // -------------------------------------------------------------
    // Logging
    // -------------------------------------------------------------
    Level level = Level::Info;
    if (!parse_level(log_level, level)) {
        std::cerr << "Unknown log level: " << log_level << " (using info)\n";
    }
    Logger::instance().set_level(level);
    Logger::instance().set_output(&std::cerr); // stdout is reserved for the schema JSON

    // -------------------------------------------------------------
    // Options
    // -------------------------------------------------------------
    schema::Options opts;
    if (!config_path.empty()) {
        const auto r = schema::load_options_file(config_path, opts);
        if (r != parser::Result::Parsed) {
            std::cerr << "Failed to load configuration '" << config_path << "': " << parser::to_string(r) << "\n";
            return EXIT_FAILURE;
        }
    }
    opts.files.insert(opts.files.end(), files.begin(), files.end());
    if (!dir.empty())      opts.dir = dir;
    if (version > 0)       opts.version = version;
    if (global_messages)   opts.global_messages = true;
    for (const auto& value : server_routes) {
        std::string route, message;
        if (split_route_(value, route, message)) {
            opts.server_routes[route] = message;
        }
    }
    for (const auto& value : client_routes) {
        std::string route, message;
        if (split_route_(value, route, message)) {
            opts.client_routes[route] = message;
        }
    }
    opts.dump(std::cerr);

    // -------------------------------------------------------------
    // Compile
    // -------------------------------------------------------------
    schema::Compiler compiler(opts);
    schema::Schema compiled;
    const auto result = compiler.compile(compiled);
    if (result != schema::compiler::Result::Compiled) {
        std::cerr << "Schema compilation failed: " << schema::compiler::to_string(result) << "\n";
        return EXIT_FAILURE;
    }

    const std::string json = schema::to_json(compiled);
    if (output.empty()) {
        std::cout << json << std::endl;
    }
    else {
        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        if (!out || !(out << json)) {
            std::cerr << "Failed to write '" << output << "'\n";
            return EXIT_FAILURE;
        }
    }

    // -------------------------------------------------------------
    // Handshake sizes
    // -------------------------------------------------------------
    const protocol::Config cfg{};
    std::cerr << "Messages       : " << compiler.messages().size() << "\n"
              << "Version        : " << compiled.version << "\n"
              << "Handshake full : " << framed_size_(protocol::handshake::response_json(cfg, &compiled)) << " bytes\n"
              << "Handshake lean : " << framed_size_(protocol::handshake::response_json(cfg, nullptr)) << " bytes\n";

    return EXIT_SUCCESS;
}
