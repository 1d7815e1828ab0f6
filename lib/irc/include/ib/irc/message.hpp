/*
Module Name:
- message.hpp

Abstract:
- Owning IRC message used on the outbound path (Outbox, connections, tests).
- Serialises to one wire line without CRLF; CR, LF and NUL inside fields are replaced by
  spaces so a single message can never smuggle a second line onto the wire.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace irc_bot::irc
{

    // Hard protocol cap for one line, CRLF included.
    inline constexpr std::size_t kMaxLineBytes = 512;
    inline constexpr std::string_view kCRLF{ "\r\n" };

    struct Message
    {
        std::string prefix; // empty when the client lets the server fill it in
        std::string command;
        std::vector<std::string> params; // middle params, no spaces, no leading ':'
        std::optional<std::string> trailing;

        // Wire form without CRLF.
        [[nodiscard]] std::string to_line() const;

        // Owning copy of an IRC line, command upper-cased. nullopt when the line has no command
        // or carries CR/LF.
        [[nodiscard]] static std::optional<Message> parse(std::string_view line);

        friend bool operator==(const Message&, const Message&) = default;
    };

    [[nodiscard]] Message make_privmsg(std::string_view target, std::string_view text);
    [[nodiscard]] Message make_quit(std::optional<std::string_view> text);
    [[nodiscard]] Message make_pong(std::string_view payload);
    [[nodiscard]] Message make_nick(std::string_view nickname);
    [[nodiscard]] Message make_user(std::string_view username, std::string_view realname);
    [[nodiscard]] Message make_join(std::string_view channels);
    [[nodiscard]] Message make_part(std::string_view channel, std::optional<std::string_view> text);

} // namespace irc_bot::irc
