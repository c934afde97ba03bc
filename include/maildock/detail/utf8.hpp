/*

utf8.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Permissive UTF-8 decoding of raw protocol lines.

*/


#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace maildock
{
namespace utf8_detail
{

inline constexpr std::string_view REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

// Length of the well-formed prefix of the sequence starting at `pos`, and whether it is complete.
struct sequence_scan
{
    std::size_t valid = 0;
    bool complete = false;
};

inline sequence_scan scan_sequence(std::string_view bytes, std::size_t pos) noexcept
{
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    if (lead < 0x80)
        return {1, true};

    std::size_t length = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
        length = 2;
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
        length = 3;
        if (lead == 0xE0)
            lower = 0xA0;
        else if (lead == 0xED)
            upper = 0x9F;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
        length = 4;
        if (lead == 0xF0)
            lower = 0x90;
        else if (lead == 0xF4)
            upper = 0x8F;
    }
    else
        return {0, false};

    sequence_scan scan{1, false};
    for (std::size_t i = 1; i < length; ++i)
    {
        if (pos + i >= bytes.size())
            return scan;
        const auto c = static_cast<unsigned char>(bytes[pos + i]);
        const unsigned char lo = (i == 1) ? lower : 0x80;
        const unsigned char hi = (i == 1) ? upper : 0xBF;
        if (c < lo || c > hi)
            return scan;
        ++scan.valid;
    }
    scan.complete = true;
    return scan;
}

} // namespace utf8_detail


[[nodiscard]] inline bool is_valid_utf8(std::string_view bytes) noexcept
{
    std::size_t pos = 0;
    while (pos < bytes.size())
    {
        const auto scan = utf8_detail::scan_sequence(bytes, pos);
        if (!scan.complete)
            return false;
        pos += scan.valid;
    }
    return true;
}

/**
Decodes bytes as UTF-8, replacing every maximal ill-formed subsequence with U+FFFD.

@param bytes Raw bytes as read from the wire.
@return      Well-formed UTF-8 text.
**/
[[nodiscard]] inline std::string decode_utf8_lossy(std::string_view bytes)
{
    if (is_valid_utf8(bytes))
        return std::string(bytes);

    std::string out;
    out.reserve(bytes.size() + 8);
    std::size_t pos = 0;
    while (pos < bytes.size())
    {
        const auto scan = utf8_detail::scan_sequence(bytes, pos);
        if (scan.complete)
        {
            out.append(bytes.data() + pos, scan.valid);
            pos += scan.valid;
            continue;
        }
        out.append(utf8_detail::REPLACEMENT_CHARACTER);
        pos += scan.valid == 0 ? 1 : scan.valid;
    }
    return out;
}

} // namespace maildock
