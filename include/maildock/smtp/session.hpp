/*

smtp/session.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <maildock/detail/result.hpp>
#include <maildock/smtp/email.hpp>
#include <maildock/smtp/limits.hpp>
#include <maildock/smtp/state.hpp>

namespace maildock::smtp
{

/**
Transaction state of one client connection.

Owned by the connection that created it; nothing else reads or writes it. The
client domain survives transaction resets, everything else is per transaction.
**/
class session
{
public:
    session() = default;

    [[nodiscard]] session_state state() const noexcept { return state_; }
    [[nodiscard]] const std::optional<std::string>& client_domain() const noexcept { return client_domain_; }
    [[nodiscard]] const std::optional<std::string>& sender() const noexcept { return sender_; }
    [[nodiscard]] const std::vector<std::string>& recipients() const noexcept { return recipients_; }
    [[nodiscard]] const std::vector<std::string>& data_lines() const noexcept { return data_lines_; }
    [[nodiscard]] bool in_data_mode() const noexcept { return in_data_mode_; }

    [[nodiscard]] std::size_t recipient_count() const noexcept { return recipients_.size(); }
    [[nodiscard]] std::size_t current_data_size() const noexcept { return data_size_; }

    /// Sender and at least one recipient, DATA not yet started.
    [[nodiscard]] bool has_complete_transaction() const noexcept
    {
        return sender_.has_value() && !recipients_.empty() && state_ == session_state::recipients_received;
    }

    [[nodiscard]] bool can_execute(verb v) const noexcept
    {
        return smtp::can_execute(state_, v);
    }

    /// Clears the transaction and returns to the post-greeting state; the client domain is kept.
    void reset() noexcept
    {
        clear_transaction();
        state_ = session_state::greeting_received;
    }

    /// Clears everything including the client domain.
    void full_reset() noexcept
    {
        clear_transaction();
        client_domain_.reset();
        state_ = session_state::initial;
    }

    result_void set_client_domain(std::string domain)
    {
        if (domain.size() > DOMAIN_MAX_LENGTH)
            return fail(errc::domain_too_long, DOMAIN_MAX_LENGTH);

        client_domain_ = std::move(domain);
        reset();
        return ok();
    }

    result_void set_sender(std::string sender)
    {
        if (sender.size() > PATH_MAX_LENGTH)
            return fail(errc::path_too_long, PATH_MAX_LENGTH);

        sender_ = std::move(sender);
        recipients_.clear();
        data_lines_.clear();
        data_size_ = 0;
        state_ = session_state::mail_received;
        return ok();
    }

    result_void add_recipient(std::string recipient)
    {
        if (recipient.size() > PATH_MAX_LENGTH)
            return fail(errc::path_too_long, PATH_MAX_LENGTH);
        if (recipients_.size() >= MAX_RECIPIENTS)
            return fail(errc::too_many_recipients, MAX_RECIPIENTS);

        recipients_.push_back(std::move(recipient));
        state_ = session_state::recipients_received;
        return ok();
    }

    result_void start_data_mode()
    {
        if (state_ != session_state::recipients_received)
            return fail(errc::invalid_state, "DATA command requires RCPT first");

        in_data_mode_ = true;
        data_lines_.clear();
        data_size_ = 0;
        state_ = session_state::data_mode;
        return ok();
    }

    /**
    Buffers one body line. Each line is accounted with its CRLF, against the
    text line limit and the cumulative data limit.
    **/
    result_void add_data_line(std::string line)
    {
        const std::size_t line_size = line.size() + LINE_TERMINATOR_OVERHEAD;
        if (line_size > TEXT_LINE_MAX_LENGTH)
            return fail(errc::line_too_long, TEXT_LINE_MAX_LENGTH);
        if (data_size_ + line_size > MAX_DATA_SIZE)
            return fail(errc::too_much_data, MAX_DATA_SIZE);

        data_lines_.push_back(std::move(line));
        data_size_ += line_size;
        return ok();
    }

    /// Ends the data phase and hands the transaction out as an email.
    result<email> finish_data_collection()
    {
        if (!in_data_mode_)
            return fail<email>(errc::invalid_state, "Not in data collection mode");
        if (!sender_)
            return fail<email>(errc::invalid_state, "No sender specified");
        if (recipients_.empty())
            return fail<email>(errc::invalid_state, "No recipients specified");

        std::string body;
        for (std::size_t i = 0; i < data_lines_.size(); ++i)
        {
            if (i > 0)
                body.push_back('\n');
            body += data_lines_[i];
        }

        email message(std::move(*sender_), std::move(recipients_), std::move(body));
        reset();
        return message;
    }

private:
    void clear_transaction() noexcept
    {
        sender_.reset();
        recipients_.clear();
        data_lines_.clear();
        data_size_ = 0;
        in_data_mode_ = false;
    }

    session_state state_ = session_state::initial;
    std::optional<std::string> client_domain_;
    std::optional<std::string> sender_;
    std::vector<std::string> recipients_;
    std::vector<std::string> data_lines_;
    std::size_t data_size_ = 0;
    bool in_data_mode_ = false;
};

} // namespace maildock::smtp
