#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace maildock
{
namespace detail
{

inline void append_sv(std::string& out, std::string_view sv)
{
    out.append(sv.data(), sv.size());
}

// Decimal rendering of the limits quoted in reply texts.
inline void append_uint(std::string& out, std::uint64_t value)
{
    char digits[20];
    const auto [end, ec] = std::to_chars(digits, digits + sizeof(digits), value);
    if (ec == std::errc())
        out.append(digits, static_cast<std::size_t>(end - digits));
}

/// One reply line: "<code><separator><text>\r\n", separator '-' for continuation lines.
inline void append_reply_line(std::string& out, std::string_view code, char separator, std::string_view text)
{
    out.reserve(out.size() + code.size() + text.size() + 3);
    append_sv(out, code);
    out.push_back(separator);
    append_sv(out, text);
    out.append("\r\n", 2);
}

} // namespace detail
} // namespace maildock
