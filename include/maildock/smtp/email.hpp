/*

smtp/email.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace maildock::smtp
{

/**
Message accepted by a completed transaction. The data is the raw body text,
lines joined by "\n", and is never interpreted by the server.
**/
class email
{
public:
    using clock = std::chrono::system_clock;

    email(std::string from, std::vector<std::string> to, std::string data,
        clock::time_point received_at = clock::now())
        : from_(std::move(from)), to_(std::move(to)), data_(std::move(data)), received_at_(received_at)
    {
    }

    [[nodiscard]] const std::string& from() const noexcept { return from_; }
    [[nodiscard]] const std::vector<std::string>& to() const noexcept { return to_; }
    [[nodiscard]] const std::string& data() const noexcept { return data_; }
    [[nodiscard]] clock::time_point received_at() const noexcept { return received_at_; }

    [[nodiscard]] bool has_recipient(std::string_view recipient) const
    {
        return std::find(to_.begin(), to_.end(), recipient) != to_.end();
    }

    [[nodiscard]] bool is_from_sender(std::string_view sender) const noexcept
    {
        return from_ == sender;
    }

    [[nodiscard]] std::size_t data_size() const noexcept { return data_.size(); }

    [[nodiscard]] bool contains_text(std::string_view text) const noexcept
    {
        return data_.find(text) != std::string::npos;
    }

    /// Value of the first "Subject: " header of the header block.
    [[nodiscard]] std::optional<std::string> subject() const
    {
        std::optional<std::string> found;
        for_each_header_line([&found](std::string_view line)
        {
            for (std::string_view prefix : {std::string_view("Subject: "), std::string_view("subject: ")})
            {
                if (line.substr(0, prefix.size()) == prefix)
                {
                    found = std::string(line.substr(prefix.size()));
                    return false;
                }
            }
            return true;
        });
        return found;
    }

    /// Text after the first blank line, if anything follows it.
    [[nodiscard]] std::optional<std::string> body() const
    {
        const auto start = body_offset();
        if (!start || *start >= data_.size())
            return std::nullopt;
        return data_.substr(*start);
    }

private:
    // Visits header lines (CR stripped) until the blank separator line or a visitor returning false.
    template<typename Visitor>
    void for_each_header_line(Visitor&& visit) const
    {
        std::size_t pos = 0;
        while (pos < data_.size())
        {
            auto end = data_.find('\n', pos);
            if (end == std::string::npos)
                end = data_.size();
            std::string_view line(data_.data() + pos, end - pos);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            if (line.empty() || !visit(line))
                return;
            pos = end + 1;
        }
    }

    [[nodiscard]] std::optional<std::size_t> body_offset() const
    {
        std::size_t pos = 0;
        while (pos < data_.size())
        {
            auto end = data_.find('\n', pos);
            if (end == std::string::npos)
                return std::nullopt;
            std::size_t length = end - pos;
            if (length > 0 && data_[end - 1] == '\r')
                --length;
            if (length == 0)
                return end + 1;
            pos = end + 1;
        }
        return std::nullopt;
    }

    std::string from_;
    std::vector<std::string> to_;
    std::string data_;
    clock::time_point received_at_;
};

} // namespace maildock::smtp
