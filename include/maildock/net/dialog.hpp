/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <maildock/detail/asio_decl.hpp>
#include <maildock/detail/log.hpp>

namespace maildock
{
namespace net
{

/// Longest raw line buffered from a client; longer lines are skipped.
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 64 * 1024;

/// Hard cap on the configurable line length (1 MB).
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Line framing over a Boost.Asio stream socket, the server side of one SMTP
conversation.

Lines end with LF; a CR before it is dropped. Reads and writes never overlap:
the caller waits for each operation before starting the next. When an idle
timeout is set, every read and write must finish within it, otherwise the
operation completes with `error::timed_out`.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    explicit dialog(Stream stream, std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> idle_timeout = std::nullopt)
        : stream_(std::move(stream)),
          deadline_(stream_.get_executor()),
          watchdog_(std::make_shared<watchdog_state>()),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          idle_timeout_(idle_timeout)
    {
    }

    dialog(const dialog&) = delete;
    dialog& operator=(const dialog&) = delete;

    /**
    Writes bytes already framed by the caller (replies carry their CRLF).

    @param payload Bytes to send; kept alive by the dialog until completion.
    @param token   Completion token, signature `void(error_code, std::size_t)`.
    **/
    template<typename CompletionToken>
    auto write(std::string payload, CompletionToken&& token)
    {
        transcript(log::direction::send, payload);
        outgoing_ = std::move(payload);
        return guarded_io([this](auto handler)
            {
                asio::async_write(stream_, asio::buffer(outgoing_), std::move(handler));
            }, std::forward<CompletionToken>(token));
    }

    /**
    Reads the next line, terminator removed. Lines already buffered by a
    previous read (pipelined commands) complete without touching the socket.

    Completes with `error::eof` when the client closed the stream. A line
    longer than the limit is skipped up to its LF and then completes with
    `error::message_size`, leaving the stream at the start of the next line.

    @param token Completion token, signature `void(error_code, std::string)`.
    **/
    template<typename CompletionToken>
    auto read_line(CompletionToken&& token)
    {
        return asio::async_compose<CompletionToken, void(asio::error_code, std::string)>(
            [this, reading = false, skipping = false](auto& self, asio::error_code ec = {}, std::size_t = 0) mutable
            {
                if (!reading)
                {
                    if (incoming_.find('\n') != std::string::npos)
                    {
                        self.complete(asio::error_code(), pop_line());
                        return;
                    }
                    reading = true;
                    fill(std::move(self));
                    return;
                }

                if (ec == asio::error::not_found)
                {
                    skipping = true;
                    incoming_.clear();
                    fill(std::move(self));
                    return;
                }
                if (ec)
                {
                    self.complete(ec, std::string());
                    return;
                }
                if (skipping)
                {
                    incoming_.erase(0, incoming_.find('\n') + 1);
                    self.complete(asio::error::message_size, std::string());
                    return;
                }
                self.complete(ec, pop_line());
            }, token, stream_);
    }

    /// Stops the deadline and closes the socket; errors are irrelevant at this point.
    void close()
    {
        ++watchdog_->generation;
        deadline_.cancel();
        asio::error_code ignore_ec;
        stream_.lowest_layer().shutdown(asio::tcp::socket::shutdown_both, ignore_ec);
        stream_.lowest_layer().close(ignore_ec);
    }

private:
    // Generation of the operation the deadline currently guards. A timer
    // completion for an older generation is stale and ignored.
    struct watchdog_state
    {
        std::uint64_t generation = 0;
        bool expired = false;
    };

    // Runs one socket operation under the idle deadline.
    template<typename Initiation, typename CompletionToken>
    auto guarded_io(Initiation initiation, CompletionToken&& token)
    {
        return asio::async_compose<CompletionToken, void(asio::error_code, std::size_t)>(
            [this, initiation = std::move(initiation), started = false](auto& self,
                asio::error_code ec = {}, std::size_t transferred = 0) mutable
            {
                if (!started)
                {
                    started = true;
                    arm_deadline();
                    initiation(std::move(self));
                    return;
                }

                ++watchdog_->generation;
                if (idle_timeout_)
                    deadline_.cancel();
                if (watchdog_->expired && ec == asio::error::operation_aborted)
                    ec = asio::error::timed_out;
                self.complete(ec, transferred);
            }, token, stream_);
    }

    // Reads until the buffer holds an LF or reaches the line length limit.
    template<typename Self>
    void fill(Self&& self)
    {
        const std::size_t limit = max_line_length_ + 2;
        guarded_io([this, limit](auto handler)
            {
                asio::async_read_until(stream_, asio::dynamic_buffer(incoming_, limit), '\n',
                    std::move(handler));
            }, std::forward<Self>(self));
    }

    void arm_deadline()
    {
        watchdog_->expired = false;
        if (!idle_timeout_)
            return;

        const auto generation = ++watchdog_->generation;
        std::weak_ptr<watchdog_state> watch = watchdog_;
        deadline_.expires_after(*idle_timeout_);
        deadline_.async_wait([this, watch, generation](asio::error_code ec)
        {
            auto state = watch.lock();
            if (ec || !state || state->generation != generation)
                return;
            state->expired = true;
            asio::error_code ignore_ec;
            stream_.lowest_layer().cancel(ignore_ec);
        });
    }

    std::string pop_line()
    {
        const auto lf = incoming_.find('\n');
        std::size_t length = lf;
        if (length > 0 && incoming_[length - 1] == '\r')
            --length;
        std::string line = incoming_.substr(0, length);
        incoming_.erase(0, lf + 1);
        transcript(log::direction::receive, line);
        return line;
    }

    static void transcript(log::direction dir, std::string_view text)
    {
        auto& logger = log::logger::instance();
        if (logger.is_trace_enabled())
            logger.trace_protocol("SMTP", dir, text);
    }

    Stream stream_;
    asio::steady_timer deadline_;
    std::shared_ptr<watchdog_state> watchdog_;
    std::string incoming_;
    std::string outgoing_;
    std::size_t max_line_length_;
    std::optional<duration> idle_timeout_;
};

} // namespace net
} // namespace maildock
