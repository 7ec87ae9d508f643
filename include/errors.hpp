#pragma once
#include <string>
#include <system_error>

namespace chatrelay {

enum class errc {
    handle_taken = 1,
    invalid_handle,
    invalid_pair,
    target_unknown,
    decode_failed,
    frame_too_large,
    truncated_frame,
    protocol_violation
};

const std::error_category& relay_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

} // namespace chatrelay

namespace std {
template <> struct is_error_code_enum<chatrelay::errc> : true_type {};
} // namespace std
