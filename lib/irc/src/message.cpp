// Owning IRC message: serialisation and the owning parse used for RawMsg reactions.

// C++ Standard Library
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

// Core
#include <ib/irc/irc_message_parser.hpp>
#include <ib/irc/message.hpp>

namespace irc_bot::irc
{

    namespace
    {
        void append_clean(std::string& out, std::string_view field)
        {
            for (char c : field)
            {
                out.push_back((c == '\r' || c == '\n' || c == '\0') ? ' ' : c);
            }
        }
    } // namespace

    std::string Message::to_line() const
    {
        std::size_t total = prefix.size() + command.size() + 4;
        for (const auto& p : params)
        {
            total += p.size() + 1;
        }
        if (trailing)
        {
            total += trailing->size() + 2;
        }

        std::string line;
        line.reserve(total);

        if (!prefix.empty())
        {
            line.push_back(':');
            append_clean(line, prefix);
            line.push_back(' ');
        }
        append_clean(line, command);

        for (const auto& p : params)
        {
            line.push_back(' ');
            append_clean(line, p);
        }

        if (trailing)
        {
            line.append(" :");
            append_clean(line, *trailing);
        }

        return line;
    }

    std::optional<Message> Message::parse(std::string_view line)
    {
        // Strip one trailing CRLF for convenience; anything else with CR/LF is two lines.
        if (line.ends_with(kCRLF))
        {
            line.remove_suffix(kCRLF.size());
        }
        if (line.find_first_of("\r\n") != std::string_view::npos)
        {
            return std::nullopt;
        }

        const auto parsed = parse_irc_line(line);
        if (parsed.command.empty())
        {
            return std::nullopt;
        }

        Message msg;
        msg.prefix = std::string{ parsed.prefix };
        // Commands are case-insensitive on the wire; keep one spelling.
        msg.command = std::string{ parsed.command };
        std::transform(msg.command.begin(), msg.command.end(), msg.command.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        msg.params.reserve(parsed.param_count);
        for (auto p : parsed.parameters())
        {
            msg.params.emplace_back(p);
        }
        if (parsed.has_trailing)
        {
            msg.trailing = std::string{ parsed.trailing };
        }
        return msg;
    }

    Message make_privmsg(std::string_view target, std::string_view text)
    {
        return Message{ .prefix = {},
                        .command = "PRIVMSG",
                        .params = { std::string{ target } },
                        .trailing = std::string{ text } };
    }

    Message make_quit(std::optional<std::string_view> text)
    {
        Message msg{ .prefix = {}, .command = "QUIT", .params = {}, .trailing = std::nullopt };
        if (text)
        {
            msg.trailing = std::string{ *text };
        }
        return msg;
    }

    Message make_pong(std::string_view payload)
    {
        return Message{ .prefix = {}, .command = "PONG", .params = {}, .trailing = std::string{ payload } };
    }

    Message make_nick(std::string_view nickname)
    {
        return Message{ .prefix = {}, .command = "NICK", .params = { std::string{ nickname } }, .trailing = std::nullopt };
    }

    Message make_user(std::string_view username, std::string_view realname)
    {
        // Mode 8 asks for +i; the unused field is "*".
        return Message{ .prefix = {},
                        .command = "USER",
                        .params = { std::string{ username }, "8", "*" },
                        .trailing = std::string{ realname } };
    }

    Message make_join(std::string_view channels)
    {
        return Message{ .prefix = {}, .command = "JOIN", .params = { std::string{ channels } }, .trailing = std::nullopt };
    }

    Message make_part(std::string_view channel, std::optional<std::string_view> text)
    {
        Message msg{ .prefix = {}, .command = "PART", .params = { std::string{ channel } }, .trailing = std::nullopt };
        if (text)
        {
            msg.trailing = std::string{ *text };
        }
        return msg;
    }

} // namespace irc_bot::irc
