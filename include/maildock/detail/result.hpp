/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Protocol failures are never thrown - every session and dispatcher operation
returns result<T>, and the caller renders the error into a reply.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace maildock
{

/// Closed set of failure kinds of the protocol engine.
enum class errc : std::uint8_t
{
    transport_failure,
    invalid_command,
    invalid_state,
    invalid_syntax,
    line_too_long,
    path_too_long,
    too_many_recipients,
    too_much_data,
    domain_too_long,
    user_too_long,
    invalid_encoding,
    connection_closed,
    protocol_violation
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::transport_failure: return "transport_failure";
        case errc::invalid_command: return "invalid_command";
        case errc::invalid_state: return "invalid_state";
        case errc::invalid_syntax: return "invalid_syntax";
        case errc::line_too_long: return "line_too_long";
        case errc::path_too_long: return "path_too_long";
        case errc::too_many_recipients: return "too_many_recipients";
        case errc::too_much_data: return "too_much_data";
        case errc::domain_too_long: return "domain_too_long";
        case errc::user_too_long: return "user_too_long";
        case errc::invalid_encoding: return "invalid_encoding";
        case errc::connection_closed: return "connection_closed";
        case errc::protocol_violation: return "protocol_violation";
    }
    return "unknown";
}

/**
Failure value carrying only what its reply text needs: a detail string for
sequencing and syntax errors, a limit for the size checks.
**/
class error
{
public:
    explicit error(errc code) noexcept : code_(code) {}

    error(errc code, std::string detail) noexcept
        : code_(code), detail_(std::move(detail)) {}

    error(errc code, std::size_t limit) noexcept
        : code_(code), limit_(limit) {}

    [[nodiscard]] errc code() const noexcept { return code_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

    [[nodiscard]] bool is(errc code) const noexcept { return code_ == code; }

private:
    errc code_;
    std::string detail_;
    std::size_t limit_ = 0;
};

template<typename T>
using result = std::expected<T, error>;

using result_void = std::expected<void, error>;

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(errc code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(errc code, std::string detail)
{
    return std::unexpected(error(code, std::move(detail)));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(errc code, std::size_t limit)
{
    return std::unexpected(error(code, limit));
}

} // namespace maildock
