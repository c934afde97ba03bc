/*

smtp/email_sink.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <maildock/smtp/email.hpp>

namespace maildock::smtp
{

namespace sink_detail
{

/**
Queue shared by the senders and the receiver of an email channel.
A capacity of zero means unbounded.
**/
class email_queue
{
public:
    explicit email_queue(std::size_t capacity) : capacity_(capacity) {}

    bool try_push(email message)
    {
        {
            std::lock_guard lock(mutex_);
            if (closed_)
                return false;
            if (capacity_ != 0 && items_.size() >= capacity_)
                return false;
            items_.push_back(std::move(message));
        }
        ready_.notify_one();
        return true;
    }

    std::optional<email> pop()
    {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take_front();
    }

    std::optional<email> try_pop()
    {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    std::optional<email> pop_for(std::chrono::steady_clock::duration timeout)
    {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return take_front();
    }

    void close()
    {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    [[nodiscard]] bool closed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    std::optional<email> take_front()
    {
        if (items_.empty())
            return std::nullopt;
        std::optional<email> front(std::move(items_.front()));
        items_.pop_front();
        return front;
    }

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<email> items_;
    std::size_t capacity_;
    bool closed_ = false;
};

} // namespace sink_detail


/**
Producer end of an email channel, handed to the server. Copies share the same
queue. A default constructed sender has no receiver and drops everything.
**/
class email_sender
{
public:
    email_sender() = default;

    explicit email_sender(std::shared_ptr<sink_detail::email_queue> queue) : queue_(std::move(queue)) {}

    /// Never blocks; returns false when the email was dropped (no receiver, closed or full).
    bool try_send(email message) const
    {
        if (!queue_)
            return false;
        return queue_->try_push(std::move(message));
    }

    [[nodiscard]] bool is_closed() const
    {
        return !queue_ || queue_->closed();
    }

private:
    std::shared_ptr<sink_detail::email_queue> queue_;
};


/**
Consumer end of an email channel. Closing it, or destroying it, makes every
later send fail; emails already queued can still be received.
**/
class email_receiver
{
public:
    explicit email_receiver(std::shared_ptr<sink_detail::email_queue> queue) : queue_(std::move(queue)) {}

    email_receiver(email_receiver&&) noexcept = default;
    email_receiver& operator=(email_receiver&& other) noexcept
    {
        if (this != &other)
        {
            close();
            queue_ = std::move(other.queue_);
        }
        return *this;
    }

    email_receiver(const email_receiver&) = delete;
    email_receiver& operator=(const email_receiver&) = delete;

    ~email_receiver()
    {
        close();
    }

    /// Blocks until an email arrives; empty once the channel is closed and drained.
    std::optional<email> receive()
    {
        if (!queue_)
            return std::nullopt;
        return queue_->pop();
    }

    std::optional<email> try_receive()
    {
        if (!queue_)
            return std::nullopt;
        return queue_->try_pop();
    }

    std::optional<email> receive_for(std::chrono::steady_clock::duration timeout)
    {
        if (!queue_)
            return std::nullopt;
        return queue_->pop_for(timeout);
    }

    void close()
    {
        if (queue_)
            queue_->close();
    }

    [[nodiscard]] std::size_t pending() const
    {
        return queue_ ? queue_->size() : 0;
    }

private:
    std::shared_ptr<sink_detail::email_queue> queue_;
};


/**
Creates a connected sender/receiver pair.

@param capacity Maximum queued emails, 0 for unbounded.
**/
[[nodiscard]] inline std::pair<email_sender, email_receiver> make_email_channel(std::size_t capacity = 0)
{
    auto queue = std::make_shared<sink_detail::email_queue>(capacity);
    return {email_sender(queue), email_receiver(queue)};
}

} // namespace maildock::smtp
