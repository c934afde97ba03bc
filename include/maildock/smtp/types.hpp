#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <maildock/config.hpp>
#include <maildock/smtp/limits.hpp>

namespace maildock
{
namespace smtp
{

/// Lines advertised after the EHLO greeting.
[[nodiscard]] inline std::vector<std::string> default_capabilities()
{
    return {"PIPELINING", "SIZE " + std::to_string(MAX_DATA_SIZE)};
}

struct server_options
{
    /// Name announced in the HELO/EHLO reply.
    std::string hostname = "maildock.local";

    /// Text of the 220 banner sent on connect.
    std::string greeting = "Welcome to maildock";

    /// Accept EHLO as a capability-advertising alias of HELO.
    bool enable_ehlo = MAILDOCK_EHLO_ENABLED != 0;

    std::vector<std::string> capabilities = default_capabilities();

    /// Close connections that stay silent this long; unset means wait forever.
    std::optional<std::chrono::steady_clock::duration> idle_timeout;

    /// Framing guard: longest raw line buffered before the connection is dropped.
    std::size_t max_read_line_length = 64 * 1024;
};

} // namespace smtp
} // namespace maildock
