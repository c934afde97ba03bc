/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process-wide logger of the server: severity filtering, a replaceable sink, and
an optional transcript of every line exchanged with SMTP clients.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

#include <maildock/detail/ascii.hpp>

namespace maildock::log
{

enum class level : std::uint8_t
{
    trace = 0,
    debug = 1,   ///< Connections accepted and closed
    info = 2,    ///< Listening address, delivered emails
    warn = 3,    ///< Connections ended by I/O failures
    error = 4,   ///< Accept loop failures
    fatal = 5,
    off = 6
};

/// Who wrote a transcript line.
enum class direction : std::uint8_t
{
    send,     ///< Server reply
    receive   ///< Client line
};

/// One transcript line, as read or written on a connection.
struct protocol_line
{
    direction dir;
    std::string protocol;
    std::string text;
};

struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;
    std::optional<protocol_line> line;
};

using callback_t = std::function<void(const entry&)>;

inline constexpr std::size_t TRANSCRIPT_MAX_LENGTH = 500;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "OFF";
}

/// Level named on the command line, case-insensitive; "warning" is accepted for warn.
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    if (detail::iequals_ascii(name, "warning"))
        return level::warn;
    for (auto lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off})
    {
        if (detail::iequals_ascii(name, level_to_string(lvl)))
            return lvl;
    }
    return std::nullopt;
}

/**
Transcript text safe for a terminal: line ends are shown escaped, other control
bytes as '.', and anything past TRANSCRIPT_MAX_LENGTH is cut.
**/
[[nodiscard]] inline std::string printable(std::string_view text)
{
    std::string out;
    const bool cut = text.size() > TRANSCRIPT_MAX_LENGTH;
    if (cut)
        text = text.substr(0, TRANSCRIPT_MAX_LENGTH);
    out.reserve(text.size() + 16);
    for (char c : text)
    {
        if (c == '\r')
            out += "\\r";
        else if (c == '\n')
            out += "\\n";
        else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F)
            out += '.';
        else
            out += c;
    }
    if (cut)
        out += "... [truncated]";
    return out;
}

/**
Renders an entry the way the default sink prints it:
`[HH:MM:SS.mmm] [LEVEL] message` or `[HH:MM:SS.mmm] SMTP C: line`.
**/
[[nodiscard]] inline std::string format(const entry& e)
{
    const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()) % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    std::ostringstream out;
    out << '[' << std::put_time(&local, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count() << "] ";
    if (e.line)
        out << e.line->protocol << (e.line->dir == direction::receive ? " C: " : " S: ") << printable(e.line->text);
    else
        out << '[' << level_to_string(e.lvl) << "] " << e.message;
    return out.str();
}

/// Global logger; every member is safe to call from any thread.
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        threshold_.store(lvl, std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return threshold_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && lvl >= get_level();
    }

    /// Routes entries to `cb` instead of stderr.
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        sink_ = std::move(cb);
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        sink_ = nullptr;
    }

    /// Transcript lines are emitted regardless of the level threshold.
    void set_trace_enabled(bool enabled) noexcept
    {
        transcript_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return transcript_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message, std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;
        emit(entry{lvl, std::chrono::system_clock::now(), std::string(message), loc, std::nullopt});
    }

    void trace_protocol(std::string_view protocol, direction dir, std::string_view text,
        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;
        emit(entry{level::trace, std::chrono::system_clock::now(), {}, loc,
            protocol_line{dir, std::string(protocol), std::string(text)}});
    }

private:
    logger() = default;

    void emit(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (sink_)
        {
            sink_(e);
            return;
        }
        std::cerr << format(e) << '\n';
    }

    std::atomic<level> threshold_{level::info};
    std::atomic<bool> transcript_{false};
    std::mutex mutex_;
    callback_t sink_;
};

} // namespace maildock::log


#define MAILDOCK_LOG(lvl, msg) \
    ::maildock::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MAILDOCK_TRACE(msg)  MAILDOCK_LOG(::maildock::log::level::trace, msg)
#define MAILDOCK_DEBUG(msg)  MAILDOCK_LOG(::maildock::log::level::debug, msg)
#define MAILDOCK_INFO(msg)   MAILDOCK_LOG(::maildock::log::level::info, msg)
#define MAILDOCK_WARN(msg)   MAILDOCK_LOG(::maildock::log::level::warn, msg)
#define MAILDOCK_ERROR(msg)  MAILDOCK_LOG(::maildock::log::level::error, msg)
#define MAILDOCK_FATAL(msg)  MAILDOCK_LOG(::maildock::log::level::fatal, msg)

#define MAILDOCK_TRACE_SEND(protocol, text) \
    ::maildock::log::logger::instance().trace_protocol(protocol, ::maildock::log::direction::send, text)

#define MAILDOCK_TRACE_RECV(protocol, text) \
    ::maildock::log::logger::instance().trace_protocol(protocol, ::maildock::log::direction::receive, text)
