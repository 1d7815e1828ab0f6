/*
Module Name:
- connection.hpp

Abstract:
- The outbound half of a server connection as the bot core sees it.
- The Outbox drain worker is the only caller of send(); failures are thrown to it and
  handled there, never to the code that produced the message.
*/
#pragma once

// C++ Standard Library
#include <string>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Core
#include <ib/irc/message.hpp>

namespace irc_bot::irc
{

    class Connection
    {
    public:
        virtual ~Connection() = default;

        // Write one message; CRLF is appended by the implementation.
        // Throws on failure (boost::system::system_error or irc_bot::Error).
        [[nodiscard]] virtual auto send(Message msg) -> boost::asio::awaitable<void> = 0;

        // Start an orderly close. Idempotent.
        virtual void close() noexcept = 0;

        // "host:port" or similar, for log lines only.
        [[nodiscard]] virtual std::string describe() const = 0;
    };

} // namespace irc_bot::irc
