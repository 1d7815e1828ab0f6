// C++ Standard Library
#include <exception>
#include <variant>
#include <iostream>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.System
#include <boost/system/error_code.hpp>

// Core
#include <ib/bot/bot.hpp>
#include <ib/bot/dispatch.hpp>
#include <ib/bot/reaction_resolver.hpp>
#include <ib/irc/message.hpp>
#include <ib/irc/msg_prefix.hpp>

namespace irc_bot
{

    Bot::Bot(Config config, ErrorHandler error_handler) :
        io_pool_{ 2 },
        worker_pool_{ config.bot().worker_threads > 0 ? config.bot().worker_threads : 1 },
        state_{ std::make_shared<State>(std::move(config), std::move(error_handler)) },
        outbox_{ std::make_shared<Outbox>(io_pool_.get_executor(), state_, state_->config().bot().outbox_capacity) },
        prefix_timer_{ boost::asio::make_strand(io_pool_) }
    {
        outbox_->set_quit_listener([this](ServerId id) { on_quit_sent(id); });
    }

    Bot::~Bot() noexcept
    {
        stop();
        worker_pool_.join();
        io_pool_.stop();
        io_pool_.join();
    }

    bool Bot::load_modules(const std::vector<std::shared_ptr<const Module>>& modules, LoadMode mode)
    {
        for (const auto& e : state_->load_modules(modules, mode))
        {
            std::cerr << "[registry] " << e.what() << '\n';
            if (std::holds_alternative<error_reaction::Quit>(state_->handle_error(e)))
            {
                return false;
            }
        }
        return true;
    }

    void Bot::start()
    {
        if (!started_.exchange(true))
        {
            outbox_->start();
        }
    }

    void Bot::run()
    {
        start();

        const auto& bot_cfg = state_->config().bot();
        for (const auto& server : state_->config().servers())
        {
            auto conn = std::make_shared<irc::TcpConnection>(
                io_pool_.get_executor(),
                server.host,
                server.port,
                irc::Identity{ .nickname = bot_cfg.nickname, .username = bot_cfg.username, .realname = bot_cfg.realname });

            live_servers_.fetch_add(1);
            boost::asio::co_spawn(conn->strand(), run_server(conn, server), boost::asio::detached);
        }

        if (live_servers_.load() == 0)
        {
            std::cerr << "[bot] no servers configured\n";
            stop();
        }
        else
        {
            boost::asio::co_spawn(prefix_timer_.get_executor(), prefix_refresh_loop(), boost::asio::detached);
        }

        // Block until every server is gone and the drain worker has exited.
        io_pool_.join();
        worker_pool_.join();
    }

    ServerId Bot::register_connection(std::shared_ptr<irc::Connection> connection)
    {
        const ServerId id = make_uuid();
        std::cout << "[bot] registered server " << to_string(id) << " (" << connection->describe() << ")\n";
        state_->register_server(id, std::move(connection));
        return id;
    }

    boost::asio::awaitable<void> Bot::run_server(std::shared_ptr<irc::TcpConnection> conn, ServerConfig server)
    {
        std::optional<ServerId> id;
        try
        {
            std::cout << "[bot] connecting to " << conn->describe() << '\n';
            co_await conn->connect();
            id = register_connection(conn);
            co_await conn->join(server.channels);

            const ServerId sid = *id;
            co_await conn->read_loop([this, sid](std::string_view line) { handle_message(sid, line); });
        }
        catch (const std::exception& e)
        {
            std::cerr << "[irc] " << conn->describe() << ": " << e.what() << '\n';
        }

        conn->close();
        if (id)
        {
            state_->deregister_server(*id);
        }
        if (live_servers_.fetch_sub(1) == 1)
        {
            std::cout << "[bot] no servers left; stopping\n";
            stop();
        }
    }

    boost::asio::awaitable<void> Bot::prefix_refresh_loop()
    {
        const auto period = state_->config().bot().prefix_refresh;
        for (;;)
        {
            prefix_timer_.expires_after(period);

            boost::system::error_code ec;
            co_await prefix_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec || stopped_.load())
            {
                co_return;
            }

            for (const auto& id : state_->server_ids())
            {
                request_prefix_update(id);
            }
        }
    }

    void Bot::handle_message(ServerId server_id, std::string_view line)
    {
        std::cout << "[irc] " << line << '\n';

        const auto msg = irc::parse_irc_line(line);
        if (msg.command == "PING")
        {
            const std::string_view payload = msg.has_trailing ? msg.trailing : msg.arg(0);
            push(server_id, LibReaction::raw(irc::make_pong(payload)));
            return;
        }
        if (msg.command == "004")
        {
            request_prefix_update(server_id);
            return;
        }
        if (msg.command == "PRIVMSG")
        {
            handle_privmsg(server_id, msg);
        }
    }

    void Bot::handle_privmsg(ServerId server_id, const irc::IrcMessage& msg)
    {
        if (msg.arg_count() < 2)
        {
            return;
        }
        const std::string_view target = msg.arg(0);
        const std::string_view text = msg.arg(1);

        std::string own_nick;
        try
        {
            own_nick = state_->nick(server_id);
        }
        catch (const Error& e)
        {
            std::cerr << "[bot] ignoring PRIVMSG: " << e.what() << '\n';
            return;
        }

        const auto cmd_line = parse_msg_to_nick(target, text, own_nick);
        if (!cmd_line)
        {
            return;
        }

        MsgMetadata metadata{ .dest = MsgDest{ .server_id = server_id, .target = std::string{ target } },
                              .prefix = irc::parse_prefix(msg.prefix) };

        if (cmd_line->empty())
        {
            try
            {
                push(server_id, resolve(*state_, metadata, reaction::Reply{ "Yes?" }));
            }
            catch (const Error& e)
            {
                std::cerr << "[bot] cannot answer: " << e.what() << '\n';
            }
            return;
        }

        if (metadata.prefix.nick == target && *cmd_line == k_update_prefix_sentinel)
        {
            try
            {
                state_->update_prefix(server_id, metadata.prefix);
            }
            catch (const Error& e)
            {
                std::cerr << "[bot] prefix update failed: " << e.what() << '\n';
            }
            return;
        }

        // The worker owns copies of everything; the parsed views die with the read buffer.
        boost::asio::post(worker_pool_,
                          [state = state_, outbox = outbox_, metadata = std::move(metadata), line = std::string{ *cmd_line }] {
                              try
                              {
                                  auto lib = handle_bot_command(*state, metadata, line);
                                  if (lib)
                                  {
                                      (void)outbox->try_push(OutboxRecord{ .server_id = metadata.dest.server_id,
                                                                           .reaction = std::move(*lib) });
                                  }
                              }
                              catch (const std::exception& e)
                              {
                                  std::cerr << "[dispatch] worker failed on \"" << line << "\": " << e.what() << '\n';
                              }
                          });
    }

    void Bot::request_prefix_update(ServerId server_id)
    {
        try
        {
            const auto nick = state_->nick(server_id);
            push(server_id, LibReaction::raw(irc::make_privmsg(nick, k_update_prefix_sentinel)));
        }
        catch (const Error& e)
        {
            std::cerr << "[bot] cannot refresh prefix: " << e.what() << '\n';
        }
    }

    void Bot::on_quit_sent(ServerId server_id)
    {
        std::cout << "[bot] quit sent on server " << to_string(server_id) << '\n';

        std::shared_ptr<irc::Connection> conn;
        try
        {
            conn = state_->connection(server_id);
        }
        catch (const Error& e)
        {
            std::cerr << "[bot] warning: " << e.what() << '\n';
        }
        if (conn)
        {
            conn->close();
        }

        if (state_->deregister_server(server_id) == 0)
        {
            stop();
        }
    }

    void Bot::push(ServerId server_id, std::optional<LibReaction> reaction)
    {
        if (reaction)
        {
            (void)outbox_->try_push(OutboxRecord{ .server_id = server_id, .reaction = std::move(*reaction) });
        }
    }

    void Bot::stop()
    {
        if (stopped_.exchange(true))
        {
            return;
        }
        std::cout << "[bot] stopping\n";

        boost::asio::post(prefix_timer_.get_executor(), [this] { prefix_timer_.cancel(); });

        for (const auto& id : state_->server_ids())
        {
            try
            {
                if (auto conn = state_->connection(id))
                {
                    conn->close();
                }
            }
            catch (const Error& e)
            {
                std::cerr << "[bot] warning: " << e.what() << '\n';
            }
        }
        outbox_->stop();
    }

    void Bot::shutdown()
    {
        worker_pool_.join();
        outbox_->stop();
        io_pool_.join();
    }

} // namespace irc_bot
