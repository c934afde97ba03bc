/*

smtp/response.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <maildock/detail/append.hpp>
#include <maildock/smtp/limits.hpp>

namespace maildock::smtp
{

inline constexpr std::string_view TRUNCATED_RESPONSE_TEXT = "Response too long (truncated)";

/**
Reply sent to an SMTP client: a three digit status code, a text, and for EHLO
an optional block of capability lines.
**/
class response
{
public:
    response(std::string code, std::string message)
        : code_(std::move(code)), message_(std::move(message))
    {
    }

    response(std::string code, std::string message, std::vector<std::string> lines)
        : code_(std::move(code)), message_(std::move(message)), multiline_(std::move(lines))
    {
    }

    [[nodiscard]] const std::string& code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::optional<std::vector<std::string>>& multiline() const noexcept { return multiline_; }

    [[nodiscard]] bool is_success() const noexcept
    {
        return !code_.empty() && code_.front() == '2';
    }

    [[nodiscard]] bool is_error() const noexcept
    {
        return !code_.empty() && (code_.front() == '4' || code_.front() == '5');
    }

    /// The server closes the connection after sending this reply.
    [[nodiscard]] bool closes_connection() const noexcept
    {
        return code_ == "221";
    }

    /**
    Wire form. A capability block renders the message as the first
    dash-continued line and the last capability with a space separator.
    **/
    [[nodiscard]] std::string format() const
    {
        std::string out;
        if (!multiline_ || multiline_->empty())
        {
            detail::append_reply_line(out, code_, ' ', message_);
            return out;
        }

        detail::append_reply_line(out, code_, '-', message_);
        const auto& lines = *multiline_;
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            const bool last = (i + 1 == lines.size());
            detail::append_reply_line(out, code_, last ? ' ' : '-', lines[i]);
        }
        return out;
    }

    static response ok()
    {
        return response("250", "OK");
    }

    static response greeting(std::string text)
    {
        return response("220", std::move(text));
    }

    static response helo(std::string_view hostname, std::string_view client_domain)
    {
        return response("250", hello_text(hostname, client_domain));
    }

    static response ehlo(std::string_view hostname, std::string_view client_domain, std::vector<std::string> capabilities)
    {
        return response("250", hello_text(hostname, client_domain), std::move(capabilities));
    }

    static response data_start()
    {
        return response("354", "End data with <CR><LF>.<CR><LF>");
    }

    static response quit()
    {
        return response("221", "Bye");
    }

private:
    static std::string hello_text(std::string_view hostname, std::string_view client_domain)
    {
        std::string text;
        detail::append_sv(text, hostname);
        detail::append_sv(text, " Hello ");
        detail::append_sv(text, client_domain);
        return text;
    }

    std::string code_;
    std::string message_;
    std::optional<std::vector<std::string>> multiline_;
};

/**
Serialized bytes ready for the wire. A reply longer than the reply line limit
is replaced by a fixed text under the same code.
**/
[[nodiscard]] inline std::string fit_for_wire(const response& r)
{
    std::string out = r.format();
    if (out.size() <= REPLY_LINE_MAX_LENGTH)
        return out;
    return response(r.code(), std::string(TRUNCATED_RESPONSE_TEXT)).format();
}

/**
Parses one single-line reply ("250 OK" with or without the trailing CRLF).

@return The code and text, or nothing when the line is not a final reply line.
**/
[[nodiscard]] inline std::optional<response> parse_response(std::string_view line)
{
    if (line.size() >= 2 && line.substr(line.size() - 2) == "\r\n")
        line.remove_suffix(2);
    else if (!line.empty() && line.back() == '\n')
        line.remove_suffix(1);

    if (line.size() < 4 || line[3] != ' ')
        return std::nullopt;
    for (std::size_t i = 0; i < 3; ++i)
    {
        if (line[i] < '0' || line[i] > '9')
            return std::nullopt;
    }
    return response(std::string(line.substr(0, 3)), std::string(line.substr(4)));
}

} // namespace maildock::smtp
