#include "protolink/protocol/message.hpp"

#include <vector>


namespace protolink::protocol::message {

bool Route::parse(std::string_view route, Route& out) {
    if (route.empty()) {
        return false;
    }

    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto dot = route.find('.', start);
        const auto part = route.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (part.find_first_not_of(" \t") == std::string_view::npos) {
            return false; // empty segment
        }
        parts.push_back(part);
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }

    Route r;
    switch (parts.size()) {
        case 2:
            r.handle_name = std::string(parts[0]);
            r.method      = std::string(parts[1]);
            break;
        case 3:
            r.node_type   = std::string(parts[0]);
            r.handle_name = std::string(parts[1]);
            r.method      = std::string(parts[2]);
            break;
        default:
            return false;
    }
    out = std::move(r);
    return true;
}

std::string Route::to_string() const {
    std::string s;
    if (!node_type.empty()) {
        s += node_type;
        s += '.';
    }
    s += handle_name;
    s += '.';
    s += method;
    return s;
}

} // namespace protolink::protocol::message
