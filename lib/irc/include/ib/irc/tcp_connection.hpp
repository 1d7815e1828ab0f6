/*
Module Name:
- tcp_connection.hpp

Abstract:
- Plaintext TCP client for one IRC server.
- All socket work runs on the connection's strand; send() hops onto it so callers on
  other executors never touch the stream directly.
- read_loop hands complete lines only; a partial line is carried to the next read.

Why:
- Keep connect on a deadline so a dead server cannot hang startup.
- Writes are serialised through a timer gate because async writes must not overlap.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core/flat_static_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

// Core
#include <ib/irc/connection.hpp>
#include <ib/irc/message.hpp>
#include <ib/utils/attributes.hpp>

namespace irc_bot::irc
{

    // Registration identity sent as NICK and USER.
    struct Identity
    {
        std::string nickname;
        std::string username;
        std::string realname;
    };

    // Must be owned by a std::shared_ptr; close() keeps the connection alive until it has run.
    class TcpConnection final : public Connection, public std::enable_shared_from_this<TcpConnection>
    {
    public:
        explicit TcpConnection(boost::asio::any_io_executor executor,
                               std::string host,
                               std::uint16_t port,
                               Identity identity);

        ~TcpConnection() noexcept override;

        TcpConnection(const TcpConnection&) = delete;
        TcpConnection& operator=(const TcpConnection&) = delete;

        // Resolve, connect and register with NICK and USER. Throws on failure.
        [[nodiscard]] auto connect() -> boost::asio::awaitable<void>;

        // JOIN the given channels, packing names into lines under the 512 byte limit.
        [[nodiscard]] auto join(std::span<const std::string> channels) -> boost::asio::awaitable<void>;

        [[nodiscard]] auto send(Message msg) -> boost::asio::awaitable<void> override;

        // Read, split on CRLF, call handler(std::string_view) per complete line.
        // The view points into internal buffers; do not retain it. Throws on read errors.
        template<typename Handler>
        [[nodiscard]] auto read_loop(Handler handler) -> boost::asio::awaitable<void>;

        void close() noexcept override;

        [[nodiscard]] std::string describe() const override;

        [[nodiscard]] boost::asio::strand<boost::asio::any_io_executor> strand() const noexcept
        {
            return strand_;
        }

    private:
        static constexpr std::size_t k_read_buffer_size = 16ULL * 1024ULL;

        // Runs on strand_. Appends CRLF.
        [[nodiscard]] auto write_line(std::string line) -> boost::asio::awaitable<void>;

        // Emit every complete line in line_tail_ and keep the remainder.
        template<typename Handler>
        void drain_lines(Handler& handler);

        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::beast::tcp_stream stream_;
        boost::beast::flat_static_buffer<k_read_buffer_size> read_buffer_;

        // Carries a partial line between reads.
        std::string line_tail_;

        std::string host_;
        std::uint16_t port_;
        Identity identity_;

        boost::asio::steady_timer write_gate_;
        bool write_inflight_ = false;
    };

    template<typename Handler>
    void TcpConnection::drain_lines(Handler& handler)
    {
        std::size_t begin = 0;
        for (;;)
        {
            const auto lf = line_tail_.find('\n', begin);
            if (lf == std::string::npos)
            {
                break;
            }

            // Accept bare LF as well as CRLF; some servers are sloppy.
            std::size_t end = lf;
            if (end > begin && line_tail_[end - 1] == '\r')
            {
                --end;
            }

            std::string_view line{ line_tail_.data() + begin, end - begin };
            if (!line.empty())
            {
                handler(line);
            }
            begin = lf + 1;
        }
        if (begin > 0)
        {
            line_tail_.erase(0, begin);
        }
    }

    template<typename Handler>
    [[nodiscard]] auto TcpConnection::read_loop(Handler handler) -> boost::asio::awaitable<void>
    {
        static_assert(std::is_invocable_r_v<void, Handler, std::string_view>,
                      "Handler must be callable as void(std::string_view)");

        for (;;)
        {
            const std::size_t n = co_await stream_.async_read_some(
                read_buffer_.prepare(read_buffer_.max_size() - read_buffer_.size()),
                boost::asio::use_awaitable);
            read_buffer_.commit(n);

            const auto bytes = read_buffer_.cdata();
            const auto total = boost::asio::buffer_size(bytes);
            if (IB_UNLIKELY(total == 0))
            {
                continue;
            }

            line_tail_.append(static_cast<const char*>(bytes.data()), total);
            read_buffer_.consume(total);

            drain_lines(handler);

            // A server that never sends LF would grow the tail without bound.
            if (line_tail_.size() > k_read_buffer_size)
            {
                line_tail_.clear();
            }
        }
    }

} // namespace irc_bot::irc
