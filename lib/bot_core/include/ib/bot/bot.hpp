/*
Module Name:
- bot.hpp

Abstract:
- Top level harness: owns the shared State, the Outbox, one I/O pool for sockets,
  timers and the drain worker, and one fixed-size worker pool for handlers.
- Each addressed command line is handled by its own worker task; workers finish in any
  order and meet again only at the Outbox.

Why:
- Handlers may block or run long; keeping them off the I/O pool keeps reads and PONGs
  flowing while a slow module works.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

// Core
#include <ib/bot/config.hpp>
#include <ib/bot/module.hpp>
#include <ib/bot/outbox.hpp>
#include <ib/bot/reaction.hpp>
#include <ib/bot/state.hpp>
#include <ib/irc/connection.hpp>
#include <ib/irc/irc_message_parser.hpp>
#include <ib/irc/tcp_connection.hpp>

namespace irc_bot
{

    class Bot
    {
    public:
        explicit Bot(Config config, ErrorHandler error_handler = default_error_handler());

        ~Bot() noexcept;

        Bot(const Bot&) = delete;
        Bot& operator=(const Bot&) = delete;

        // Load modules. Each error is logged and passed to the error handler; returns false
        // if the handler answered Quit.
        bool load_modules(const std::vector<std::shared_ptr<const Module>>& modules, LoadMode mode);

        // Connect to every configured server and block until the bot stops.
        void run();

        // Start the outbox drain worker without connecting anywhere.
        void start();

        // Attach a connection made elsewhere and return its id.
        ServerId register_connection(std::shared_ptr<irc::Connection> connection);

        // Handle one inbound protocol line from a server. Thread-safe.
        void handle_message(ServerId server_id, std::string_view line);

        // Close every connection and let the pools run dry. Idempotent.
        void stop();

        // Wait for in-flight workers, flush the outbox, then join the I/O pool.
        void shutdown();

        [[nodiscard]] State& state() noexcept
        {
            return *state_;
        }

        [[nodiscard]] Outbox& outbox() noexcept
        {
            return *outbox_;
        }

    private:
        [[nodiscard]] boost::asio::awaitable<void> run_server(std::shared_ptr<irc::TcpConnection> conn,
                                                              ServerConfig server);
        [[nodiscard]] boost::asio::awaitable<void> prefix_refresh_loop();

        void handle_privmsg(ServerId server_id, const irc::IrcMessage& msg);
        void request_prefix_update(ServerId server_id);
        void on_quit_sent(ServerId server_id);
        void push(ServerId server_id, std::optional<LibReaction> reaction);

        boost::asio::thread_pool io_pool_; // sockets, timers, drain worker
        boost::asio::thread_pool worker_pool_; // handler invocations

        std::shared_ptr<State> state_;
        std::shared_ptr<Outbox> outbox_;

        boost::asio::steady_timer prefix_timer_; // on its own strand

        std::atomic<int> live_servers_{ 0 };
        std::atomic<bool> started_{ false };
        std::atomic<bool> stopped_{ false };
    };

} // namespace irc_bot
