/*

smtp/address.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Parsing of the MAIL FROM / RCPT TO path argument and validation of the
enclosed address.

*/


#pragma once

#include <string>
#include <string_view>

#include <maildock/detail/ascii.hpp>
#include <maildock/detail/result.hpp>
#include <maildock/smtp/limits.hpp>

namespace maildock::smtp
{

/**
Checks the shape and component sizes of a mailbox address: exactly one "@",
a non-empty local part of at most 64 bytes, a non-empty domain of at most 64
bytes.
**/
[[nodiscard]] inline result_void validate_address(std::string_view address)
{
    const auto at = address.find('@');
    if (at == std::string_view::npos)
        return fail(errc::invalid_syntax, "Email address must contain @ symbol");
    if (address.find('@', at + 1) != std::string_view::npos)
        return fail(errc::invalid_syntax, "Email address must contain exactly one @ symbol");

    const std::string_view user = address.substr(0, at);
    const std::string_view domain = address.substr(at + 1);

    if (user.size() > USER_MAX_LENGTH)
        return fail(errc::user_too_long, USER_MAX_LENGTH);
    if (domain.size() > DOMAIN_MAX_LENGTH)
        return fail(errc::domain_too_long, DOMAIN_MAX_LENGTH);
    if (user.empty() || domain.empty())
        return fail(errc::invalid_syntax, "Invalid email address format");

    return ok();
}

/**
Extracts the address from a path argument such as "FROM:<alice@example.com>".

@param argument Command arguments joined by single spaces.
@param keyword  "FROM:" or "TO:", matched case-insensitively.
@param command  Command name used in the error details.
@return         The address between the angle brackets.
**/
[[nodiscard]] inline result<std::string> parse_path_argument(std::string_view argument, std::string_view keyword,
    std::string_view command)
{
    const std::string_view field = keyword.substr(0, keyword.size() - 1);
    std::string text;

    if (!detail::istarts_with_ascii(argument, keyword))
    {
        text.append(command).append(" command must be '").append(command).append(" ")
            .append(keyword).append("<address>'");
        return fail<std::string>(errc::invalid_syntax, std::move(text));
    }

    const std::string_view path = detail::trim_view(argument.substr(keyword.size()));
    if (path.size() < 2 || path.front() != '<' || path.back() != '>')
    {
        text.append(field).append(" address must be enclosed in angle brackets");
        return fail<std::string>(errc::invalid_syntax, std::move(text));
    }

    const std::string_view address = path.substr(1, path.size() - 2);
    if (address.find_first_of("<>") != std::string_view::npos)
    {
        text.append(field).append(" address must be enclosed in angle brackets");
        return fail<std::string>(errc::invalid_syntax, std::move(text));
    }
    if (address.empty())
    {
        text.append(field).append(" address cannot be empty");
        return fail<std::string>(errc::invalid_syntax, std::move(text));
    }

    return std::string(address);
}

} // namespace maildock::smtp
