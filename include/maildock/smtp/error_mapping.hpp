/*

error_mapping.hpp
-----------------

Centralized mapping between maildock::errc and SMTP replies. Existing clients
match on these codes and texts, so they are reproduced byte for byte.

*/

#pragma once

#include <string>
#include <string_view>

#include <maildock/detail/append.hpp>
#include <maildock/detail/result.hpp>
#include <maildock/smtp/response.hpp>

namespace maildock::smtp
{

[[nodiscard]] constexpr std::string_view reply_code(errc code) noexcept
{
    switch (code)
    {
        case errc::transport_failure: return "421";
        case errc::invalid_command: return "500";
        case errc::invalid_state: return "503";
        case errc::invalid_syntax: return "501";
        case errc::line_too_long: return "500";
        case errc::path_too_long: return "501";
        case errc::too_many_recipients: return "552";
        case errc::too_much_data: return "552";
        case errc::domain_too_long: return "501";
        case errc::user_too_long: return "501";
        case errc::invalid_encoding: return "500";
        case errc::connection_closed: return "421";
        case errc::protocol_violation: return "500";
    }
    return "500";
}

[[nodiscard]] inline std::string reply_message(const error& err)
{
    std::string out;
    auto with_limit = [&out, &err](std::string_view head, std::string_view tail)
    {
        detail::append_sv(out, head);
        detail::append_uint(out, err.limit());
        detail::append_sv(out, tail);
        return out;
    };

    switch (err.code())
    {
        case errc::transport_failure:
            return "Service not available";
        case errc::invalid_command:
            return "Syntax error, command unrecognized";
        case errc::invalid_state:
            detail::append_sv(out, "Bad sequence of commands: ");
            detail::append_sv(out, err.detail());
            return out;
        case errc::invalid_syntax:
            detail::append_sv(out, "Syntax error: ");
            detail::append_sv(out, err.detail());
            return out;
        case errc::line_too_long:
            return with_limit("Line too long (max ", " characters)");
        case errc::path_too_long:
            return with_limit("Path too long (max ", " characters)");
        case errc::too_many_recipients:
            return with_limit("Too many recipients (max ", ")");
        case errc::too_much_data:
            return with_limit("Too much mail data (max ", " bytes)");
        case errc::domain_too_long:
            return with_limit("Domain name too long (max ", " characters)");
        case errc::user_too_long:
            return with_limit("User name too long (max ", " characters)");
        case errc::invalid_encoding:
            return "Invalid character encoding";
        case errc::connection_closed:
            return "Connection closed";
        case errc::protocol_violation:
            return "Protocol violation";
    }
    return "Protocol violation";
}

[[nodiscard]] inline response to_response(const error& err)
{
    return response(std::string(reply_code(err.code())), reply_message(err));
}

} // namespace maildock::smtp
