#include "SquareErrors.hpp"

#include <string>

namespace {
    class SquareCategory : public boost::system::error_category {
    public:
        const char* name() const noexcept override {
            return "square";
        }

        std::string message(int ev) const override {
            switch (static_cast<SquareErrc>(ev)) {
                case SquareErrc::backend_error:
                    return "square backend reported an error";
                case SquareErrc::malformed_response:
                    return "malformed square backend response";
                case SquareErrc::bad_status:
                    return "unexpected HTTP status from square backend";
            }
            return "unknown square error";
        }
    };
}

const boost::system::error_category& square_category() {
    static const SquareCategory category;
    return category;
}

boost::system::error_code make_error_code(SquareErrc e) {
    return boost::system::error_code(static_cast<int>(e), square_category());
}
