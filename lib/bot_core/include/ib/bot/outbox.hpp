/*
Module Name:
- outbox.hpp

Abstract:
- Bounded multi-producer queue of resolved reactions plus the single drain worker that
  sends them in order.
- Producers never block: a full queue drops the record and logs it.
- The drain worker is one coroutine on its own strand. A send failure goes to the
  operator's error handler once; whatever that yields is sent, and a failure of that
  send is only logged.

Why:
- The gate timer lets the drain worker sleep until a push without polling.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

// Core
#include <ib/bot/ids.hpp>
#include <ib/bot/reaction.hpp>
#include <ib/irc/connection.hpp>

namespace irc_bot
{

    class State;

    struct OutboxRecord
    {
        ServerId server_id{};
        LibReaction reaction;
    };

    class Outbox
    {
    public:
        // Called on the drain strand after a QUIT went out on a server.
        using QuitListener = std::function<void(ServerId)>;

        // Pre: state != nullptr, capacity > 0
        Outbox(boost::asio::any_io_executor executor, std::shared_ptr<const State> state, std::size_t capacity);

        Outbox(const Outbox&) = delete;
        Outbox& operator=(const Outbox&) = delete;

        // Thread-safe, never blocks. Returns false (and logs) when the queue is full.
        bool try_push(OutboxRecord record);

        void set_quit_listener(QuitListener listener);

        // Spawn the drain worker. Call once.
        void start();

        // The drain worker exits once the queue is empty.
        void stop();

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] std::size_t capacity() const noexcept
        {
            return capacity_;
        }

        [[nodiscard]] std::uint64_t dropped_count() const noexcept
        {
            return dropped_.load(std::memory_order_relaxed);
        }

    private:
        [[nodiscard]] boost::asio::awaitable<void> drain();
        [[nodiscard]] boost::asio::awaitable<void> send_record(OutboxRecord record);

        // Returns true when the error handler answered Quit; the server is then done.
        [[nodiscard]] boost::asio::awaitable<bool> handle_send_error(ServerId server_id,
                                                                     std::shared_ptr<irc::Connection> conn,
                                                                     const Error& error);

        [[nodiscard]] std::optional<OutboxRecord> pop();
        void wake();

        boost::asio::strand<boost::asio::any_io_executor> strand_;
        std::shared_ptr<const State> state_;
        const std::size_t capacity_;

        mutable std::mutex mutex_; // protects queue_
        std::deque<OutboxRecord> queue_;

        boost::asio::steady_timer gate_;
        std::atomic<bool> stopping_{ false };
        std::atomic<std::uint64_t> dropped_{ 0 };

        QuitListener on_quit_;
    };

} // namespace irc_bot
