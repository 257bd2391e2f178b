#ifndef SQUAREERRORS_HPP
#define SQUAREERRORS_HPP

#include <boost/system/error_code.hpp>

#include <type_traits>

// Failures of the square backend that are not transport errors.
enum class SquareErrc {
    backend_error = 1,  // backend replied {"error": ...}
    malformed_response, // body is neither a square nor an error
    bad_status          // HTTP status other than 200
};

const boost::system::error_category& square_category();

boost::system::error_code make_error_code(SquareErrc e);

namespace boost {
namespace system {
template <>
struct is_error_code_enum<SquareErrc> : std::true_type {};
}
}

#endif // SQUAREERRORS_HPP
