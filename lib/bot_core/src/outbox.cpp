// C++ Standard Library
#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.System
#include <boost/system/error_code.hpp>

// GSL
#include <gsl/gsl>

// Core
#include <ib/bot/outbox.hpp>
#include <ib/bot/reaction_resolver.hpp>
#include <ib/bot/state.hpp>

namespace irc_bot
{

    Outbox::Outbox(boost::asio::any_io_executor executor, std::shared_ptr<const State> state, std::size_t capacity) :
        strand_{ boost::asio::make_strand(executor) }, state_{ std::move(state) }, capacity_{ capacity }, gate_{ strand_ }
    {
        Expects(state_ != nullptr);
        Expects(capacity_ > 0);

        gate_.expires_at(std::chrono::steady_clock::time_point::max());
    }

    bool Outbox::try_push(OutboxRecord record)
    {
        {
            std::lock_guard lk(mutex_);
            if (queue_.size() >= capacity_)
            {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                const Error full(errc::outbox_full,
                                 std::to_string(capacity_) + " records queued; dropping a record for server " +
                                     to_string(record.server_id));
                std::cerr << "[outbox] " << full.what() << '\n';
                return false;
            }
            queue_.push_back(std::move(record));
        }
        wake();
        return true;
    }

    void Outbox::set_quit_listener(QuitListener listener)
    {
        on_quit_ = std::move(listener);
    }

    void Outbox::start()
    {
        boost::asio::co_spawn(strand_, drain(), boost::asio::detached);
    }

    void Outbox::stop()
    {
        stopping_.store(true, std::memory_order_release);
        wake();
    }

    std::size_t Outbox::size() const
    {
        std::lock_guard lk(mutex_);
        return queue_.size();
    }

    std::optional<OutboxRecord> Outbox::pop()
    {
        std::lock_guard lk(mutex_);
        if (queue_.empty())
        {
            return std::nullopt;
        }
        auto rec = std::move(queue_.front());
        queue_.pop_front();
        return rec;
    }

    void Outbox::wake()
    {
        // The gate is only touched on the strand.
        boost::asio::post(strand_, [this] { gate_.cancel(); });
    }

    boost::asio::awaitable<void> Outbox::drain()
    {
        for (;;)
        {
            auto rec = pop();
            if (!rec)
            {
                if (stopping_.load(std::memory_order_acquire))
                {
                    co_return;
                }

                boost::system::error_code ec;
                gate_.expires_at(std::chrono::steady_clock::time_point::max());
                co_await gate_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }

            try
            {
                co_await send_record(std::move(*rec));
            }
            catch (const std::exception& e)
            {
                std::cerr << "[outbox] dropping record after unexpected failure: " << e.what() << '\n';
            }
        }
    }

    boost::asio::awaitable<void> Outbox::send_record(OutboxRecord record)
    {
        const auto id_str = to_string(record.server_id);

        std::shared_ptr<irc::Connection> conn;
        try
        {
            conn = state_->connection(record.server_id);
        }
        catch (const Error& e)
        {
            std::cerr << "[outbox] warning: " << e.what() << "; dropping record for server " << id_str << '\n';
            co_return;
        }
        if (!conn)
        {
            std::cerr << "[outbox] warning: unknown server " << id_str << "; dropping record\n";
            co_return;
        }

        for (auto& msg : record.reaction.flatten())
        {
            const bool is_quit = msg.command == "QUIT";

            std::optional<Error> failure;
            try
            {
                co_await conn->send(std::move(msg));
            }
            catch (const std::exception& e)
            {
                failure.emplace(errc::send_failed, conn->describe() + ": " + e.what());
            }

            if (failure)
            {
                std::cerr << "[outbox] send failed: " << failure->what() << '\n';
                if (co_await handle_send_error(record.server_id, conn, *failure))
                {
                    co_return;
                }
                continue;
            }

            if (is_quit)
            {
                if (on_quit_)
                {
                    on_quit_(record.server_id);
                }
                co_return;
            }
        }
    }

    boost::asio::awaitable<bool> Outbox::handle_send_error(ServerId server_id,
                                                           std::shared_ptr<irc::Connection> conn,
                                                           const Error& error)
    {
        const auto answer = state_->handle_error(error);
        const auto* quit = std::get_if<error_reaction::Quit>(&answer);
        if (!quit)
        {
            co_return false;
        }

        const std::string text = quit->text.value_or(default_quit_message());

        // Second level: a failure here is not handed back to the error handler.
        try
        {
            co_await conn->send(irc::make_quit(text));
        }
        catch (const std::exception& e)
        {
            std::cerr << "[outbox] sending QUIT for the error handler failed: " << e.what() << '\n';
        }

        if (on_quit_)
        {
            on_quit_(server_id);
        }
        co_return true;
    }

} // namespace irc_bot
