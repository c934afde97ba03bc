/*

smtp/dispatcher.hpp
-------------------

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

#include <maildock/config.hpp>
#include <maildock/detail/ascii.hpp>
#include <maildock/detail/result.hpp>
#include <maildock/smtp/address.hpp>
#include <maildock/smtp/email.hpp>
#include <maildock/smtp/limits.hpp>
#include <maildock/smtp/response.hpp>
#include <maildock/smtp/session.hpp>
#include <maildock/smtp/state.hpp>
#include <maildock/smtp/types.hpp>

namespace maildock::smtp
{

/**
Turns client lines into session mutations.

Outside the data phase every line goes through dispatch(), which validates it
against the session state and answers with a reply or an error. While the
session is in data mode, lines go through collect() until the "." terminator.
**/
class dispatcher
{
public:
    explicit dispatcher(std::string hostname, bool enable_ehlo = MAILDOCK_EHLO_ENABLED != 0,
        std::vector<std::string> capabilities = default_capabilities())
        : hostname_(std::move(hostname)),
          enable_ehlo_(enable_ehlo && MAILDOCK_EHLO_ENABLED != 0),
          capabilities_(std::move(capabilities))
    {
    }

    explicit dispatcher(const server_options& opts)
        : dispatcher(opts.hostname, opts.enable_ehlo, opts.capabilities)
    {
    }

    [[nodiscard]] const std::string& hostname() const noexcept { return hostname_; }
    [[nodiscard]] bool ehlo_enabled() const noexcept { return enable_ehlo_; }

    /**
    Processes one command line, CRLF already stripped.

    A rejected command leaves the session as it was.
    **/
    result<response> dispatch(std::string_view line, session& s) const
    {
        if (line.size() > COMMAND_LINE_MAX_LENGTH)
            return fail<response>(errc::line_too_long, COMMAND_LINE_MAX_LENGTH);

        const auto parts = detail::split_whitespace(line);
        if (parts.empty())
            return fail<response>(errc::invalid_command);

        const auto v = parse_verb(parts.front());
        if (!v || (*v == verb::ehlo && !enable_ehlo_))
            return fail<response>(errc::invalid_command);

        switch (*v)
        {
            case verb::helo:
            case verb::ehlo:
                return handle_hello(*v, parts, s);
            case verb::mail:
                return handle_mail(parts, s);
            case verb::rcpt:
                return handle_rcpt(parts, s);
            case verb::data:
                return handle_data(parts, s);
            case verb::rset:
                return handle_rset(s);
            case verb::noop:
                return response::ok();
            case verb::quit:
                return response::quit();
        }
        return fail<response>(errc::invalid_command);
    }

    /**
    Processes one line of the data phase.

    @return An email once the "." terminator arrives, nothing while the
            phase continues. Any error aborts the transaction: the session is
            reset, keeping the client domain.
    **/
    result<std::optional<email>> collect(std::string line, session& s) const
    {
        if (!s.in_data_mode())
            return fail<std::optional<email>>(errc::invalid_state, "Not in data collection mode");

        if (line == ".")
        {
            auto message = s.finish_data_collection();
            if (!message)
            {
                s.reset();
                return std::unexpected(std::move(message.error()));
            }
            return std::optional<email>(std::move(*message));
        }

        auto added = s.add_data_line(std::move(line));
        if (!added)
        {
            s.reset();
            return std::unexpected(std::move(added.error()));
        }
        return std::optional<email>();
    }

private:
    using tokens = std::vector<std::string_view>;

    result<response> handle_hello(verb v, const tokens& parts, session& s) const
    {
        if (parts.size() != 2)
        {
            std::string text(verb_name(v));
            text += parts.size() < 2 ? " requires domain argument" : " takes exactly one domain argument";
            return fail<response>(errc::invalid_syntax, std::move(text));
        }

        std::string client_domain(parts[1]);
        auto set = s.set_client_domain(client_domain);
        if (!set)
            return std::unexpected(std::move(set.error()));

        if (v == verb::ehlo)
            return response::ehlo(hostname_, client_domain, capabilities_);
        return response::helo(hostname_, client_domain);
    }

    result<response> handle_mail(const tokens& parts, session& s) const
    {
        if (!s.can_execute(verb::mail))
            return fail<response>(errc::invalid_state, "MAIL command requires HELO first");
        if (parts.size() < 2)
            return fail<response>(errc::invalid_syntax, "MAIL requires FROM argument");

        auto address = parse_path_argument(detail::join(parts, 1, " "), "FROM:", "MAIL");
        if (!address)
            return std::unexpected(std::move(address.error()));
        auto valid = validate_address(*address);
        if (!valid)
            return std::unexpected(std::move(valid.error()));

        auto set = s.set_sender(std::move(*address));
        if (!set)
            return std::unexpected(std::move(set.error()));
        return response::ok();
    }

    result<response> handle_rcpt(const tokens& parts, session& s) const
    {
        if (!s.can_execute(verb::rcpt))
            return fail<response>(errc::invalid_state, "RCPT command requires MAIL first");
        if (parts.size() < 2)
            return fail<response>(errc::invalid_syntax, "RCPT requires TO argument");

        auto address = parse_path_argument(detail::join(parts, 1, " "), "TO:", "RCPT");
        if (!address)
            return std::unexpected(std::move(address.error()));
        auto valid = validate_address(*address);
        if (!valid)
            return std::unexpected(std::move(valid.error()));

        auto added = s.add_recipient(std::move(*address));
        if (!added)
            return std::unexpected(std::move(added.error()));
        return response::ok();
    }

    result<response> handle_data(const tokens& parts, session& s) const
    {
        if (!s.can_execute(verb::data))
            return fail<response>(errc::invalid_state, "DATA command requires RCPT first");
        if (parts.size() > 1)
            return fail<response>(errc::invalid_syntax, "DATA command takes no arguments");

        auto started = s.start_data_mode();
        if (!started)
            return std::unexpected(std::move(started.error()));
        return response::data_start();
    }

    result<response> handle_rset(session& s) const
    {
        if (!s.can_execute(verb::rset))
            return fail<response>(errc::invalid_state, "RSET command requires HELO first");

        s.reset();
        return response::ok();
    }

    std::string hostname_;
    bool enable_ehlo_;
    std::vector<std::string> capabilities_;
};

} // namespace maildock::smtp
