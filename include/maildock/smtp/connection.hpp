/*

smtp/connection.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <memory>
#include <string>
#include <utility>

#include <maildock/detail/asio_decl.hpp>
#include <maildock/detail/log.hpp>
#include <maildock/detail/utf8.hpp>
#include <maildock/net/dialog.hpp>
#include <maildock/net/error_mapping.hpp>
#include <maildock/smtp/dispatcher.hpp>
#include <maildock/smtp/email_sink.hpp>
#include <maildock/smtp/error_mapping.hpp>
#include <maildock/smtp/response.hpp>
#include <maildock/smtp/session.hpp>
#include <maildock/smtp/types.hpp>

namespace maildock::smtp
{

/**
Drives one client: greeting, then one reply per command line until QUIT or
until the stream ends. The session lives and dies with the connection.
**/
template<typename Stream>
class connection
{
public:
    connection(Stream stream, std::shared_ptr<const dispatcher> commands, email_sender sink,
        const server_options& opts)
        : dialog_(std::move(stream), opts.max_read_line_length, opts.idle_timeout),
          commands_(std::move(commands)),
          sink_(std::move(sink)),
          greeting_(opts.greeting)
    {
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    asio::awaitable<void> run()
    {
        if (!co_await send(response::greeting(greeting_)))
            co_return;

        while (true)
        {
            asio::error_code ec;
            std::string raw = co_await dialog_.read_line(asio::redirect_error(asio::use_awaitable, ec));
            if (ec == asio::error::message_size)
            {
                if (!co_await reject_long_line())
                    break;
                continue;
            }
            if (ec)
            {
                co_await end_on_read_error(ec);
                break;
            }

            std::string line = decode_utf8_lossy(raw);
            if (session_.in_data_mode())
            {
                if (!co_await on_data_line(std::move(line)))
                    break;
                continue;
            }

            auto reply = commands_->dispatch(line, session_);
            if (!reply)
            {
                if (!co_await send(to_response(reply.error())))
                    break;
                continue;
            }
            if (!co_await send(*reply))
                break;
            if (reply->closes_connection())
            {
                MAILDOCK_DEBUG("SMTP client quit");
                break;
            }
        }

        dialog_.close();
        session_.full_reset();
    }

private:
    asio::awaitable<bool> on_data_line(std::string line)
    {
        auto collected = commands_->collect(std::move(line), session_);
        if (!collected)
            co_return co_await send(to_response(collected.error()));
        if (!collected->has_value())
            co_return true;

        deliver(std::move(**collected));
        co_return co_await send(response::ok());
    }

    void deliver(email message)
    {
        std::string summary = "Email from <" + message.from() + "> to " +
            std::to_string(message.to().size()) + " recipient(s), " +
            std::to_string(message.data_size()) + " bytes";
        if (sink_.try_send(std::move(message)))
            MAILDOCK_INFO(summary);
        else
            MAILDOCK_DEBUG(summary + " dropped: no live receiver");
    }

    asio::awaitable<void> end_on_read_error(asio::error_code ec)
    {
        if (net::is_peer_closed(ec))
        {
            MAILDOCK_DEBUG("SMTP client closed the connection");
            co_return;
        }

        MAILDOCK_WARN(net::describe_net_error(net::io_stage::read, ec));
        if (ec == asio::error::timed_out)
            co_await send(to_response(maildock::error(errc::transport_failure)));
    }

    // The dialog skipped a line longer than its buffer. Answer it like any
    // other overlong line; in the data phase the transaction is abandoned.
    asio::awaitable<bool> reject_long_line()
    {
        std::size_t limit = COMMAND_LINE_MAX_LENGTH;
        if (session_.in_data_mode())
        {
            limit = TEXT_LINE_MAX_LENGTH;
            session_.reset();
        }
        MAILDOCK_DEBUG("SMTP line over the read buffer discarded");
        co_return co_await send(to_response(maildock::error(errc::line_too_long, limit)));
    }

    // Writes one reply; false when the stream is no longer usable.
    asio::awaitable<bool> send(const response& reply)
    {
        asio::error_code ec;
        co_await dialog_.write(fit_for_wire(reply), asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
        {
            if (net::is_peer_closed(ec))
                MAILDOCK_DEBUG(net::describe_net_error(net::io_stage::write, ec));
            else
                MAILDOCK_WARN(net::describe_net_error(net::io_stage::write, ec));
            co_return false;
        }
        co_return true;
    }

    net::dialog<Stream> dialog_;
    std::shared_ptr<const dispatcher> commands_;
    email_sender sink_;
    std::string greeting_;
    session session_;
};

} // namespace maildock::smtp
