#include "common/errors.hpp"

namespace segedit {

namespace {

class SegeditCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "segedit"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::not_found:           return "not found";
            case Errc::invalid_input:       return "invalid input";
            case Errc::unsatisfiable_range: return "range not satisfiable";
            case Errc::data_unavailable:    return "data unavailable";
            case Errc::io_failure:          return "i/o failure";
        }
        return "unknown segedit error";
    }
};

} // namespace

const std::error_category& error_category() noexcept {
    static const SegeditCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

Error::Error(Errc code, const std::string& message)
    : std::runtime_error(message), code_(make_error_code(code)) {}

Error::Error(std::error_code code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

} // namespace segedit
