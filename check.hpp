#pragma once
#include <string>
#include <string_view>
#include <system_error>

// Turn an error_code out-parameter into a std::system_error at API boundaries
inline void throw_if_err(const std::error_code& ec, std::string_view where) {
    if (ec) throw std::system_error(ec, std::string(where));
}
