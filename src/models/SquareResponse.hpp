#ifndef SQUARERESPONSE_HPP
#define SQUARERESPONSE_HPP

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

// Body of a /squareme reply. The backend answers either
//   {"msg": <num * num>, "ttl(ms)": <ttl>}
// or
//   {"error": "<message>"}
// "ttl" is accepted as an alias of "ttl(ms)".
class SquareResponse {
public:
    std::optional<uint32_t> square;
    std::optional<uint32_t> ttl_ms;
    std::optional<std::string> error;
    bool parse_success = false;

    bool isSquare() const { return parse_success && square && ttl_ms; }
    bool isError() const { return parse_success && error.has_value(); }

    // Never throws; parse_success is false if the body is not one of the two
    // shapes above.
    static SquareResponse fromJson(const std::string& body);

    std::string to_string() const {
        std::ostringstream oss;
        oss << "SquareResponse {";
        if (square) {
            oss << " msg: " << *square;
        }
        if (ttl_ms) {
            oss << " ttl(ms): " << *ttl_ms;
        }
        if (error) {
            oss << " error: " << *error;
        }
        oss << " parse_success: " << std::boolalpha << parse_success << " }";
        return oss.str();
    }
};

#endif // SQUARERESPONSE_HPP
