// Plaintext IRC client over a Beast tcp_stream.

// Why:
// - Keep connect on a deadline to avoid hanging startup.
// - Serialise writes explicitly; overlapping async writes on one socket interleave bytes.
// - Failures propagate to the caller so the outbox can route them to the error handler.

// C++ Standard Library
#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/write.hpp>

// Boost.System
#include <boost/system/error_code.hpp>

// Core
#include <ib/irc/tcp_connection.hpp>

namespace irc_bot::irc
{

    using boost::asio::use_awaitable;
    using error_code = boost::system::error_code;

    TcpConnection::TcpConnection(boost::asio::any_io_executor executor,
                                 std::string host,
                                 std::uint16_t port,
                                 Identity identity) :
        strand_{ boost::asio::make_strand(executor) }, stream_{ strand_ }, host_{ std::move(host) }, port_{ port }, identity_{ std::move(identity) }, write_gate_{ strand_ }
    {
        write_gate_.expires_at(std::chrono::steady_clock::time_point::max());
    }

    TcpConnection::~TcpConnection() noexcept = default;

    auto TcpConnection::connect() -> boost::asio::awaitable<void>
    {
        auto executor = co_await boost::asio::this_coro::executor;

        boost::asio::ip::tcp::resolver resolver{ executor };
        auto results = co_await resolver.async_resolve(host_, std::to_string(port_), use_awaitable);

        stream_.expires_after(std::chrono::seconds(30));
        co_await stream_.async_connect(results, use_awaitable);
        stream_.expires_never();

        stream_.socket().set_option(boost::asio::ip::tcp::no_delay(true));
        stream_.socket().set_option(boost::asio::socket_base::keep_alive(true));

        co_await send(make_nick(identity_.nickname));
        co_await send(make_user(identity_.username, identity_.realname));
    }

    auto TcpConnection::join(std::span<const std::string> channels) -> boost::asio::awaitable<void>
    {
        if (channels.empty())
        {
            co_return;
        }

        // "JOIN " + names + CRLF must stay within one line.
        static constexpr std::size_t k_join_overhead = 5 + kCRLF.size();

        std::string names;
        for (const auto& ch : channels)
        {
            const std::size_t needed = (names.empty() ? 0 : 1) + ch.size();
            if (!names.empty() && names.size() + needed + k_join_overhead > kMaxLineBytes)
            {
                co_await send(make_join(names));
                names.clear();
            }

            if (!names.empty())
            {
                names.push_back(',');
            }
            names.append(ch);
        }

        if (!names.empty())
        {
            co_await send(make_join(names));
        }
    }

    auto TcpConnection::send(Message msg) -> boost::asio::awaitable<void>
    {
        // Hop to the connection strand; exceptions from write_line rethrow here.
        co_await boost::asio::co_spawn(strand_, write_line(msg.to_line()), use_awaitable);
    }

    auto TcpConnection::write_line(std::string line) -> boost::asio::awaitable<void>
    {
        while (write_inflight_)
        {
            error_code ec;
            write_gate_.expires_at(std::chrono::steady_clock::time_point::max());
            co_await write_gate_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        }

        line.append(kCRLF);

        write_inflight_ = true;
        try
        {
            co_await boost::asio::async_write(stream_, boost::asio::buffer(line), use_awaitable);
        }
        catch (const std::exception&)
        {
            write_inflight_ = false;
            write_gate_.cancel();
            throw;
        }
        write_inflight_ = false;

        write_gate_.cancel(); // wake one waiter
    }

    void TcpConnection::close() noexcept
    {
        try
        {
            boost::asio::dispatch(strand_, [self = shared_from_this()] {
                error_code ec;
                self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
                self->stream_.close();
                self->write_gate_.cancel();
            });
        }
        catch (const std::exception& e)
        {
            std::cerr << "[irc] close failed for " << describe() << ": " << e.what() << '\n';
        }
    }

    std::string TcpConnection::describe() const
    {
        return host_ + ":" + std::to_string(port_);
    }

} // namespace irc_bot::irc
