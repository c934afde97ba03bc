/*

smtp/state.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string_view>

#include <maildock/detail/ascii.hpp>

namespace maildock::smtp
{

enum class session_state
{
    initial,
    greeting_received,
    mail_received,
    recipients_received,
    data_mode
};

[[nodiscard]] constexpr std::string_view state_name(session_state s) noexcept
{
    switch (s)
    {
        case session_state::initial: return "initial";
        case session_state::greeting_received: return "greeting_received";
        case session_state::mail_received: return "mail_received";
        case session_state::recipients_received: return "recipients_received";
        case session_state::data_mode: return "data_mode";
    }
    return "initial";
}

/// Command verbs understood by the server.
enum class verb
{
    helo,
    ehlo,
    mail,
    rcpt,
    data,
    rset,
    noop,
    quit
};

[[nodiscard]] constexpr std::string_view verb_name(verb v) noexcept
{
    switch (v)
    {
        case verb::helo: return "HELO";
        case verb::ehlo: return "EHLO";
        case verb::mail: return "MAIL";
        case verb::rcpt: return "RCPT";
        case verb::data: return "DATA";
        case verb::rset: return "RSET";
        case verb::noop: return "NOOP";
        case verb::quit: return "QUIT";
    }
    return "NOOP";
}

/// Case-insensitive lookup of a command token.
[[nodiscard]] inline std::optional<verb> parse_verb(std::string_view token) noexcept
{
    for (verb v : {verb::helo, verb::ehlo, verb::mail, verb::rcpt, verb::data, verb::rset, verb::noop, verb::quit})
    {
        if (detail::iequals_ascii(token, verb_name(v)))
            return v;
    }
    return std::nullopt;
}

/**
Whether `v` may run in state `s`. Greeting, NOOP and QUIT are accepted at any
time; the transaction verbs follow HELO -> MAIL -> RCPT+ -> DATA.
**/
[[nodiscard]] constexpr bool can_execute(session_state s, verb v) noexcept
{
    switch (v)
    {
        case verb::helo:
        case verb::ehlo:
        case verb::noop:
        case verb::quit:
            return true;
        case verb::mail:
            return s == session_state::greeting_received;
        case verb::rcpt:
            return s == session_state::mail_received || s == session_state::recipients_received;
        case verb::data:
            return s == session_state::recipients_received;
        case verb::rset:
            return s != session_state::initial;
    }
    return false;
}

} // namespace maildock::smtp
