/*
Module: default_module.cpp

Purpose:
- The "default" module's handlers.

Notes:
- Arguments are plain words: the first word of part's argument is taken as the channel
  only if it looks like one ('#' or '&'), otherwise the whole argument is the part message.
- part with no channel from a private message cannot guess a channel and asks for one.
*/

// C++ Standard Library
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Core
#include <ib/bot/error.hpp>
#include <ib/bot/state.hpp>

// App
#include <app/default_module.hpp>

namespace app
{

    using irc_bot::AuthLevel;
    using irc_bot::BotCmdResult;
    using irc_bot::HandlerContext;
    namespace reaction = irc_bot::reaction;
    namespace result = irc_bot::result;

    namespace
    {
        constexpr std::string_view kWhitespace = " \t";

        // Split off the first word; both halves come back trimmed.
        std::pair<std::string_view, std::string_view> split_word(std::string_view s) noexcept
        {
            const auto b = s.find_first_not_of(kWhitespace);
            if (b == std::string_view::npos)
            {
                return { {}, {} };
            }
            s.remove_prefix(b);

            const auto e = s.find_first_of(kWhitespace);
            if (e == std::string_view::npos)
            {
                return { s, {} };
            }

            auto rest = s.substr(e);
            const auto r = rest.find_first_not_of(kWhitespace);
            rest = (r == std::string_view::npos) ? std::string_view{} : rest.substr(r);
            return { s.substr(0, e), rest };
        }

        bool looks_like_channel(std::string_view word) noexcept
        {
            return !word.empty() && (word.front() == '#' || word.front() == '&');
        }

        std::string join_names(const std::vector<std::string>& names)
        {
            std::string out;
            for (const auto& n : names)
            {
                if (!out.empty())
                {
                    out.append(", ");
                }
                out.append(n);
            }
            return out;
        }

        constexpr std::string_view kListNames = "commands, lists";

        BotCmdResult join(const HandlerContext&, std::string_view arg)
        {
            if (arg.empty())
            {
                return result::ArgMissing{ "channel" };
            }
            return reaction::RawMsg{ "JOIN " + std::string{ arg } };
        }

        BotCmdResult part(const HandlerContext& ctx, std::string_view arg)
        {
            auto [first, rest] = split_word(arg);

            std::string channel;
            std::string_view comment = arg;
            if (looks_like_channel(first))
            {
                channel = std::string{ first };
                comment = rest;
            }
            else
            {
                std::string own_nick;
                try
                {
                    own_nick = ctx.state.nick(ctx.metadata.dest.server_id);
                }
                catch (const irc_bot::Error& e)
                {
                    return e;
                }

                if (ctx.metadata.dest.target == own_nick)
                {
                    return result::ArgMissing1To1{ "channel" };
                }
                channel = ctx.metadata.dest.target;
            }

            std::string line = "PART " + channel;
            if (!comment.empty())
            {
                line.append(" :").append(comment);
            }
            return reaction::RawMsg{ std::move(line) };
        }

        BotCmdResult quit(const HandlerContext&, std::string_view arg)
        {
            if (arg.empty())
            {
                return reaction::Quit{};
            }
            return reaction::Quit{ std::string{ arg } };
        }

        BotCmdResult ping(const HandlerContext&, std::string_view arg)
        {
            if (!arg.empty())
            {
                return result::SyntaxErr{};
            }
            return reaction::Reply{ "pong" };
        }

        BotCmdResult source(const HandlerContext&, std::string_view arg)
        {
            if (!arg.empty())
            {
                return result::SyntaxErr{};
            }
            const auto homepage = irc_bot::State::framework_homepage();
            return reaction::Reply{ "<" + std::string{ homepage.empty() ? "unknown" : homepage } + ">" };
        }

        BotCmdResult help_for_command(const HandlerContext& ctx, std::string_view name)
        {
            const auto cmd = ctx.state.command(name);
            if (!cmd)
            {
                return reaction::Msg{ "Command \"" + std::string{ name } + "\" not found." };
            }

            const std::string provider = cmd->provider ? cmd->provider->name() : std::string{ "?" };
            return reaction::Msgs{ {
                "= Help for command \"" + cmd->name + "\":",
                "- [module \"" + provider + "\", auth level " + std::string{ irc_bot::to_string(cmd->auth_level) } + "]",
                "- Syntax: " + cmd->name + " " + cmd->usage,
                cmd->help,
            } };
        }

        BotCmdResult help_list(const HandlerContext& ctx, std::string_view list_name)
        {
            if (list_name == "commands")
            {
                return reaction::Msg{ "Available commands: " + join_names(ctx.state.command_names()) };
            }
            if (list_name == "lists")
            {
                return reaction::Msg{ "Available lists: " + std::string{ kListNames } };
            }
            return reaction::Msg{ "List \"" + std::string{ list_name } + "\" not found. Available lists: " +
                                  std::string{ kListNames } };
        }

        BotCmdResult help(const HandlerContext& ctx, std::string_view arg)
        {
            if (arg.empty())
            {
                return reaction::Msgs{ {
                    "For help with a command named 'foo', try `help foo`.",
                    "To see a list of all available commands, try `help list commands`.",
                    "For this bot software's documentation, see <" +
                        std::string{ irc_bot::State::framework_homepage() } + ">",
                } };
            }

            const auto [first, rest] = split_word(arg);
            if (first == "list")
            {
                if (rest.empty())
                {
                    return result::ArgMissing{ "list name" };
                }
                return help_list(ctx, rest);
            }
            if (!rest.empty())
            {
                return reaction::Msg{ "Please ask for help with one thing at a time." };
            }
            return help_for_command(ctx, first);
        }
    } // namespace

    std::shared_ptr<const irc_bot::Module> default_module()
    {
        return irc_bot::ModuleBuilder{ "default" }
            .command("join", "<channel>", "Have the bot join the given channel.", AuthLevel::Admin, join)
            .command("part",
                     "[channel] [message]",
                     "Have the bot part from the given channel (defaults to the current channel), "
                     "with an optional part message.",
                     AuthLevel::Admin,
                     part)
            .command("quit", "[message]", "Have the bot quit.", AuthLevel::Admin, quit)
            .command("ping",
                     "",
                     "Request a short message from the bot, typically for testing purposes.",
                     AuthLevel::Public,
                     ping)
            .command("source",
                     "",
                     "Request information about the bot, such as the URL of a Web page about its software.",
                     AuthLevel::Public,
                     source)
            .command("help",
                     "[command | list <list name>]",
                     "Request help with the bot's features, such as commands.",
                     AuthLevel::Public,
                     help)
            .end();
    }

} // namespace app
