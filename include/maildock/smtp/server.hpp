/*

smtp/server.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <maildock/detail/asio_decl.hpp>
#include <maildock/detail/log.hpp>
#include <maildock/net/error_mapping.hpp>
#include <maildock/smtp/connection.hpp>
#include <maildock/smtp/dispatcher.hpp>
#include <maildock/smtp/email_sink.hpp>
#include <maildock/smtp/types.hpp>

namespace maildock
{

/// Thrown when the server cannot be set up (bad address, port in use).
class server_error : public std::runtime_error
{
public:
    explicit server_error(const std::string& msg) : std::runtime_error(msg) {}
    explicit server_error(const char* msg) : std::runtime_error(msg) {}
};

namespace smtp
{

/**
SMTP endpoint for tests: accepts clients, runs one connection per client and
pushes every completed message to the email sink.

The acceptor, the dispatcher and the sink live in a state block shared by the
accept loop and every connection, so the server object may be destroyed while
clients are still connected. The acceptor runs on its own strand and each
client on another, so the io_context may be run from several threads.

Usage:
@code
asio::io_context ctx;
auto [sender, receiver] = smtp::make_email_channel();
smtp::server srv(ctx, std::move(sender));
srv.listen("127.0.0.1", 0);
srv.start();
std::thread io([&ctx] { ctx.run(); });
auto message = receiver.receive_for(std::chrono::seconds(5));
@endcode
**/
class server
{
public:
    using executor_type = asio::any_io_executor;
    using tcp = asio::tcp;

    server(executor_type executor, email_sender sink, server_options opts = {})
        : state_(std::make_shared<shared_state>(executor, std::move(sink), std::move(opts)))
    {
    }

    server(asio::io_context& context, email_sender sink, server_options opts = {})
        : server(context.get_executor(), std::move(sink), std::move(opts))
    {
    }

    server(const server&) = delete;
    server& operator=(const server&) = delete;

    /// Closes the acceptor; connections keep the shared state alive until they end.
    ~server()
    {
        stop();
    }

    [[nodiscard]] const server_options& options() const noexcept { return state_->options; }

    /**
    Binds the listening socket. Port 0 picks an ephemeral port, see local_endpoint().

    @throw server_error The address does not parse or cannot be bound.
    **/
    void listen(const std::string& address, unsigned short port)
    {
        asio::error_code ec;
        const auto ip = asio::ip::make_address(address, ec);
        if (ec)
            throw server_error("Invalid listen address '" + address + "': " + ec.message());

        auto& acceptor = state_->acceptor;
        const tcp::endpoint endpoint(ip, port);
        acceptor.open(endpoint.protocol(), ec);
        if (!ec)
            acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec)
            acceptor.bind(endpoint, ec);
        if (!ec)
            acceptor.listen(asio::socket_base::max_listen_connections, ec);
        tcp::endpoint bound;
        if (!ec)
            bound = acceptor.local_endpoint(ec);
        if (ec)
        {
            asio::error_code ignore_ec;
            acceptor.close(ignore_ec);
            throw server_error("Cannot listen on " + address + ":" + std::to_string(port) + ": " + ec.message());
        }
        bound_ = bound;
    }

    /// Listens on "host:port".
    void listen(const std::string& host_port)
    {
        const auto colon = host_port.rfind(':');
        if (colon == std::string::npos || colon + 1 == host_port.size())
            throw server_error("Listen address must be host:port, got '" + host_port + "'");

        unsigned long port = 0;
        try
        {
            std::size_t used = 0;
            port = std::stoul(host_port.substr(colon + 1), &used);
            if (used != host_port.size() - colon - 1)
                throw std::invalid_argument("trailing characters");
        }
        catch (const std::exception&)
        {
            throw server_error("Invalid port in '" + host_port + "'");
        }
        if (port > 65535)
            throw server_error("Invalid port in '" + host_port + "'");

        std::string host = host_port.substr(0, colon);
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
            host = host.substr(1, host.size() - 2);
        listen(host, static_cast<unsigned short>(port));
    }

    /// Address bound by the last successful listen().
    [[nodiscard]] tcp::endpoint local_endpoint() const
    {
        if (!bound_)
            throw server_error("Server is not listening");
        return *bound_;
    }

    [[nodiscard]] bool is_listening() const noexcept { return bound_.has_value(); }

    /// Spawns the accept loop on the acceptor strand.
    void start()
    {
        if (!bound_)
            throw server_error("start() requires listen() first");

        MAILDOCK_INFO("SMTP server listening on " + describe(*bound_));
        asio::co_spawn(state_->strand, accept_loop(state_), asio::detached);
    }

    /// Stops accepting; connections already running finish on their own.
    void stop()
    {
        bound_.reset();
        asio::post(state_->strand, [state = state_]
        {
            asio::error_code ignore_ec;
            state->acceptor.close(ignore_ec);
        });
    }

private:
    struct shared_state
    {
        shared_state(executor_type executor, email_sender sink, server_options opts)
            : io(executor),
              strand(asio::make_strand(executor)),
              options(std::move(opts)),
              commands(std::make_shared<const dispatcher>(options)),
              sink(std::move(sink)),
              acceptor(strand)
        {
        }

        executor_type io;
        executor_type strand;
        const server_options options;
        std::shared_ptr<const dispatcher> commands;
        email_sender sink;
        tcp::acceptor acceptor;
    };

    static asio::awaitable<void> accept_loop(std::shared_ptr<shared_state> state)
    {
        while (state->acceptor.is_open())
        {
            asio::error_code ec;
            executor_type client_strand = asio::make_strand(state->io);
            tcp::socket socket = co_await state->acceptor.async_accept(client_strand,
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec == asio::error::operation_aborted || !state->acceptor.is_open())
                break;
            if (ec)
            {
                MAILDOCK_ERROR(net::describe_net_error(net::io_stage::accept, ec));
                continue;
            }

            asio::error_code peer_ec;
            const auto peer = socket.remote_endpoint(peer_ec);
            MAILDOCK_DEBUG("SMTP connection from " + (peer_ec ? std::string("unknown peer") : describe(peer)));
            asio::co_spawn(client_strand, serve(state, std::move(socket)), asio::detached);
        }
        MAILDOCK_DEBUG("SMTP accept loop stopped");
    }

    static asio::awaitable<void> serve(std::shared_ptr<shared_state> state, tcp::socket socket)
    {
        connection<tcp::socket> conn(std::move(socket), state->commands, state->sink, state->options);
        co_await conn.run();
    }

    static std::string describe(const tcp::endpoint& endpoint)
    {
        std::string out = endpoint.address().to_string();
        if (endpoint.address().is_v6())
            out = "[" + out + "]";
        out += ":";
        out += std::to_string(endpoint.port());
        return out;
    }

    std::shared_ptr<shared_state> state_;
    std::optional<tcp::endpoint> bound_;
};

} // namespace smtp
} // namespace maildock
