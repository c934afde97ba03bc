#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace maildock
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool istarts_with_ascii(std::string_view s, std::string_view prefix) noexcept
    {
        return s.size() >= prefix.size() && iequals_ascii(s.substr(0, prefix.size()), prefix);
    }

    // SMTP separates command tokens with SP and HTAB; CR, LF, FF and VT are treated alike.
    [[nodiscard]] constexpr bool is_ascii_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        while (!sv.empty() && is_ascii_space(sv.front()))
            sv.remove_prefix(1);
        while (!sv.empty() && is_ascii_space(sv.back()))
            sv.remove_suffix(1);
        return sv;
    }

    // Splits on runs of ASCII whitespace; leading and trailing runs produce no empty tokens.
    [[nodiscard]] inline std::vector<std::string_view> split_whitespace(std::string_view sv)
    {
        std::vector<std::string_view> tokens;
        std::size_t i = 0;
        while (i < sv.size())
        {
            while (i < sv.size() && is_ascii_space(sv[i]))
                ++i;
            const std::size_t start = i;
            while (i < sv.size() && !is_ascii_space(sv[i]))
                ++i;
            if (i > start)
                tokens.push_back(sv.substr(start, i - start));
        }
        return tokens;
    }

    [[nodiscard]] inline std::string join(const std::vector<std::string_view>& parts, std::size_t first, std::string_view separator)
    {
        std::string out;
        for (std::size_t i = first; i < parts.size(); ++i)
        {
            if (i > first)
                out.append(separator.data(), separator.size());
            out.append(parts[i].data(), parts[i].size());
        }
        return out;
    }
} // namespace detail
} // namespace maildock
