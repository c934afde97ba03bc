/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

The Boost.Asio names the server is written against, gathered in
maildock::asio.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <utility>
#include <boost/asio.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "maildock requires coroutine support (C++20) in Boost.Asio"
#endif

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace maildock::asio
{
    // Execution: one io_context, coroutines spawned detached per client, each
    // client on its own strand.
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::make_strand;
    using boost::asio::awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::post;

    // Completion tokens; errors are redirected, never thrown into the coroutine.
    using boost::asio::use_awaitable;
    using boost::asio::redirect_error;

    // Listening socket, client sockets, idle timers.
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;
    using boost::asio::socket_base;
    using boost::asio::steady_timer;

    // Line-oriented I/O.
    using boost::asio::buffer;
    using boost::asio::dynamic_buffer;
    using boost::asio::async_compose;
    using boost::asio::async_read_until;
    using boost::asio::async_write;

    // Blocking counterparts used by test clients and examples.
    using boost::asio::streambuf;
    using boost::asio::read_until;
    using boost::asio::write;

    namespace error = boost::asio::error;
    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;
} // namespace maildock::asio
