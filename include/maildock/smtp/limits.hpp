/*

smtp/limits.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Size limits of RFC 821 section 4.5.3, plus the in-memory data cap.

*/


#pragma once

#include <cstddef>

namespace maildock::smtp
{

/// Local part of an address (before "@").
inline constexpr std::size_t USER_MAX_LENGTH = 64;

/// Domain part of an address, and the HELO argument.
inline constexpr std::size_t DOMAIN_MAX_LENGTH = 64;

/// Reverse-path or forward-path, without the angle brackets.
inline constexpr std::size_t PATH_MAX_LENGTH = 256;

inline constexpr std::size_t COMMAND_LINE_MAX_LENGTH = 512;

inline constexpr std::size_t REPLY_LINE_MAX_LENGTH = 512;

/// Text line of the data phase, CRLF included.
inline constexpr std::size_t TEXT_LINE_MAX_LENGTH = 1000;

inline constexpr std::size_t MAX_RECIPIENTS = 100;

inline constexpr std::size_t MAX_DATA_SIZE = 10 * 1024 * 1024;

/// Accounted size of the line terminator of every data line.
inline constexpr std::size_t LINE_TERMINATOR_OVERHEAD = 2;

} // namespace maildock::smtp
