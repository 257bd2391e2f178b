#include "SquareResponse.hpp"

#include <limits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
    std::optional<uint32_t> readUnsigned(const json& body, const char* field) {
        auto it = body.find(field);
        if (it == body.end() || !it->is_number_unsigned()) {
            return std::nullopt;
        }
        auto value = it->get<uint64_t>();
        if (value > std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(value);
    }
}

SquareResponse SquareResponse::fromJson(const std::string& body) {
    SquareResponse response;
    json parsed = json::parse(body, nullptr, /* allow_exceptions */ false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return response;
    }

    // The square shape is tried first.
    auto square = readUnsigned(parsed, "msg");
    auto ttl_ms = readUnsigned(parsed, "ttl(ms)");
    if (!ttl_ms) {
        ttl_ms = readUnsigned(parsed, "ttl");
    }
    if (square && ttl_ms) {
        response.square = square;
        response.ttl_ms = ttl_ms;
        response.parse_success = true;
        return response;
    }

    auto error_it = parsed.find("error");
    if (error_it != parsed.end() && error_it->is_string()) {
        response.error = error_it->get<std::string>();
        response.parse_success = true;
    }
    return response;
}
