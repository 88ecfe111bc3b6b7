#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace segedit {

// ── Error taxonomy ────────────────────────────────────────────────────────────
//
//   not_found           – project, segment, chunk or audio file absent
//   invalid_input       – no recognised fields in an update, malformed range
//   unsatisfiable_range – range outside the file bounds
//   data_unavailable    – backing file missing or unparsable at load time
//   io_failure          – a persistence write (backup, temp file, rename) failed
//
// "No rows match" is never an error: it is an empty result.

enum class Errc {
    not_found = 1,
    invalid_input,
    unsatisfiable_range,
    data_unavailable,
    io_failure,
};

} // namespace segedit

namespace std {
template <>
struct is_error_code_enum<segedit::Errc> : true_type {};
} // namespace std

namespace segedit {

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// Exception raised by the store, index, registry and router layers.
// Low-level persistence helpers return std::error_code instead.
class Error : public std::runtime_error {
public:
    Error(Errc code, const std::string& message);
    Error(std::error_code code, const std::string& message);

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }

    // True if the carried code is the given segedit condition.
    [[nodiscard]] bool is(Errc e) const noexcept { return code_ == make_error_code(e); }

private:
    std::error_code code_;
};

} // namespace segedit
