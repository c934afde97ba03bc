/*

error_mapping.hpp
-----------------

Centralized mapping between Asio error codes and maildock::errc for network I/O.

*/

#pragma once

#include <string>
#include <string_view>

#include <maildock/detail/asio_decl.hpp>
#include <maildock/detail/result.hpp>

namespace maildock::net
{

enum class io_stage
{
    accept,
    read,
    write
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::accept: return "accept";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
    }
    return "unknown";
}

/// Peer went away: end of stream, reset or broken pipe.
[[nodiscard]] inline bool is_peer_closed(maildock::asio::error_code ec) noexcept
{
    return ec == maildock::asio::error::eof ||
        ec == maildock::asio::error::connection_reset ||
        ec == maildock::asio::error::connection_aborted ||
        ec == maildock::asio::error::broken_pipe;
}

[[nodiscard]] inline errc map_net_error(maildock::asio::error_code ec) noexcept
{
    if (is_peer_closed(ec))
        return errc::connection_closed;
    if (ec == maildock::asio::error::message_size)
        return errc::line_too_long;
    return errc::transport_failure;
}

/// One-line description for the connection log.
[[nodiscard]] inline std::string describe_net_error(io_stage stage, maildock::asio::error_code ec)
{
    std::string out(stage_name(stage));
    out += " failed: ";
    out += to_string(map_net_error(ec));
    out += " (";
    out += ec.message();
    out += ")";
    return out;
}

} // namespace maildock::net
