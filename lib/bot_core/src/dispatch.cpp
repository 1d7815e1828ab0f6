/*
Module Name:
- dispatch.cpp

Abstract:
- Addressing checks, command and trigger dispatch, failure replies.

Why:
- Copy the registry entry out before running it so a concurrent reload cannot pull the
  handler out from under this worker.
- Contain handler exceptions at the call site; a bad module must not end the worker.
*/

// C++ Standard Library
#include <iostream>
#include <utility>
#include <vector>

// Core
#include <ib/bot/dispatch.hpp>
#include <ib/bot/error.hpp>
#include <ib/bot/reaction_resolver.hpp>
#include <ib/bot/state.hpp>
#include <ib/bot/trigger.hpp>
#include <ib/irc/message.hpp>

#include "invoke_guarded.hpp"

namespace irc_bot
{

    namespace
    {
        constexpr std::string_view kWhitespace = " \t\n\r\f\v";

        std::string_view trim(std::string_view sv) noexcept
        {
            const auto b = sv.find_first_not_of(kWhitespace);
            if (b == std::string_view::npos)
                return {};
            const auto e = sv.find_last_not_of(kWhitespace);
            return sv.substr(b, e - b + 1);
        }

        std::string quote_name(std::string_view s)
        {
            return "\"" + std::string{ s } + "\"";
        }

        // A raw QUIT ends the session as surely as Quit does.
        bool is_quit(const BotCmdResult& res)
        {
            const auto* ok = res.get_if<result::Ok>();
            if (!ok)
            {
                return false;
            }
            if (std::holds_alternative<reaction::Quit>(ok->reaction))
            {
                return true;
            }
            if (const auto* raw = std::get_if<reaction::RawMsg>(&ok->reaction))
            {
                const auto msg = irc::Message::parse(raw->line);
                return msg && msg->command == "QUIT";
            }
            return false;
        }

        // Pre: is_quit(res)
        std::string quit_text_repr(const BotCmdResult& res)
        {
            const auto& out = res.get_if<result::Ok>()->reaction;
            if (const auto* quit = std::get_if<reaction::Quit>(&out))
            {
                return quit->text ? quote_name(*quit->text) : std::string{ "None" };
            }
            const auto msg = irc::Message::parse(std::get<reaction::RawMsg>(out).line);
            return msg && msg->trailing ? quote_name(*msg->trailing) : std::string{ "None" };
        }

        // Fall back to the raw destination if even the reply target cannot be worked out.
        std::string error_target(const State& state, const MsgMetadata& metadata)
        {
            try
            {
                return state.guess_reply_dest(metadata).target;
            }
            catch (const Error& e)
            {
                std::cerr << "[dispatch] cannot work out reply target: " << e.what() << '\n';
                return metadata.dest.target;
            }
        }

        // Wrapped like any other reply; the error text may quote a line of any length.
        std::optional<LibReaction> error_reply(const State& state, const MsgMetadata& metadata, std::string_view text)
        {
            const auto target = error_target(state, metadata);
            try
            {
                std::vector<LibReaction> parts;
                for (auto& msg : compose_msg(state, metadata.dest.server_id, target, {}, text))
                {
                    parts.push_back(LibReaction::raw(std::move(msg)));
                }
                if (parts.empty())
                {
                    return std::nullopt;
                }
                if (parts.size() == 1)
                {
                    return std::move(parts.front());
                }
                return LibReaction::multi(std::move(parts));
            }
            catch (const Error& e)
            {
                std::cerr << "[dispatch] cannot send error reply to \"" << target << "\": " << e.what() << '\n';
                return std::nullopt;
            }
        }
    } // namespace

    bool is_msg_to_nick(std::string_view target, std::string_view text, std::string_view nick) noexcept
    {
        if (nick.empty())
            return false;
        if (target == nick || text == nick)
            return true;
        return text.size() > nick.size() && text.starts_with(nick) &&
               (text[nick.size()] == ':' || text[nick.size()] == ',');
    }

    std::optional<std::string_view> parse_msg_to_nick(std::string_view target,
                                                      std::string_view text,
                                                      std::string_view nick) noexcept
    {
        if (!is_msg_to_nick(target, text, nick))
            return std::nullopt;

        if (text == nick)
            return std::string_view{};

        if (text.size() > nick.size() && text.starts_with(nick) &&
            (text[nick.size()] == ':' || text[nick.size()] == ','))
        {
            return trim(text.substr(nick.size() + 1));
        }

        // Private message without the nick in front.
        return trim(text);
    }

    namespace
    {
        BotCmdResult run_command(const State& state,
                                 const MsgMetadata& metadata,
                                 const BotCommand& cmd,
                                 std::string_view arg)
        {
            const bool authorized = cmd.auth_level == AuthLevel::Public || state.have_admin(metadata.prefix);
            if (!authorized)
            {
                return result::Unauthorized{};
            }

            std::cout << "[dispatch] running command \"" << cmd.name << "\" with arg \"" << arg << "\"\n";

            const HandlerContext ctx{ .state = state, .metadata = metadata, .feature_name = cmd.name };
            auto res = detail::invoke_guarded("command", cmd.name, [&] { return cmd.handler->invoke(ctx, arg); });

            if (is_quit(res) && cmd.auth_level != AuthLevel::Admin)
            {
                return result::BotErrMsg{
                    "Only commands at authorization level Admin may tell the bot to quit, but the command " +
                    quote_name(cmd.name) + " from module " + quote_name(cmd.provider->name()) +
                    ", at authorization level " + std::string{ to_string(cmd.auth_level) } +
                    ", has told the bot to quit with quit message " + quit_text_repr(res) + "."
                };
            }
            return res;
        }
    } // namespace

    std::optional<BotCmdResult> run_bot_command(const State& state,
                                                const MsgMetadata& metadata,
                                                std::string_view name,
                                                std::string_view arg)
    {
        auto cmd = state.command(name);
        if (!cmd)
        {
            return std::nullopt;
        }
        return run_command(state, metadata, *cmd, arg);
    }

    Reaction result_to_reaction(std::string_view feature_name, std::string_view usage, BotCmdResult res)
    {
        const std::string name = quote_name(feature_name);

        return std::visit(
            [&](auto&& r) -> Reaction {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, result::Ok>)
                {
                    return std::move(r.reaction);
                }
                else if constexpr (std::is_same_v<T, result::Unauthorized>)
                {
                    return reaction::Reply{ "My apologies, but you do not appear to have sufficient authority to use my " +
                                            name + " command." };
                }
                else if constexpr (std::is_same_v<T, result::ParamUnauthorized>)
                {
                    return reaction::Reply{ "My apologies, but you do not appear to have sufficient authority to use the " +
                                            quote_name(r.param) + " parameter of my " + name + " command." };
                }
                else if constexpr (std::is_same_v<T, result::SyntaxErr>)
                {
                    return reaction::Reply{ "Syntax: " + std::string{ feature_name } + " " + std::string{ usage } };
                }
                else if constexpr (std::is_same_v<T, result::ArgMissing>)
                {
                    return reaction::Reply{ "Syntax error: For command " + name + ", the argument " + quote_name(r.arg) +
                                            " is required, but it was not given." };
                }
                else if constexpr (std::is_same_v<T, result::ArgMissing1To1>)
                {
                    return reaction::Reply{ "Syntax error: When command " + name +
                                            " is used outside of a channel, the argument " + quote_name(r.arg) +
                                            " is required, but it was not given." };
                }
                else if constexpr (std::is_same_v<T, result::LibErr>)
                {
                    // Panics were logged where they were caught.
                    if (r.error.kind() != errc::handler_panic)
                    {
                        std::cerr << "[dispatch] error from " << name << ": " << r.error.what() << '\n';
                    }
                    return reaction::Reply{ "Error: " + std::string{ r.error.what() } };
                }
                else if constexpr (std::is_same_v<T, result::UserErrMsg>)
                {
                    return reaction::Reply{ "User error: " + r.text };
                }
                else
                {
                    static_assert(std::is_same_v<T, result::BotErrMsg>);
                    std::cerr << "[dispatch] internal error from " << name << ": " << r.text << '\n';
                    return reaction::Reply{ "Internal error: " + r.text };
                }
            },
            std::move(res).release());
    }

    Reaction bot_command_reaction(const State& state, const MsgMetadata& metadata, std::string_view cmd_line)
    {
        cmd_line = trim(cmd_line);

        const auto split = cmd_line.find_first_of(kWhitespace);
        const std::string_view cmd_name = cmd_line.substr(0, split);
        const std::string_view cmd_args = split == std::string_view::npos ? std::string_view{} : trim(cmd_line.substr(split));

        if (const auto cmd = state.command(cmd_name))
        {
            return result_to_reaction(cmd->name, cmd->usage, run_command(state, metadata, *cmd, cmd_args));
        }

        if (auto outcome = run_any_matching(state, cmd_line, metadata))
        {
            if (is_quit(outcome->result))
            {
                return result_to_reaction(
                    outcome->trigger_name,
                    {},
                    result::BotErrMsg{ "Only commands at authorization level Admin may tell the bot to quit, but the "
                                       "trigger " +
                                       quote_name(outcome->trigger_name) + " has told the bot to quit with quit message " +
                                       quit_text_repr(outcome->result) + "." });
            }
            return result_to_reaction(outcome->trigger_name, {}, std::move(outcome->result));
        }

        return reaction::Reply{ "Unknown command " + quote_name(cmd_name) + "; apologies." };
    }

    std::optional<LibReaction> handle_bot_command(const State& state,
                                                  const MsgMetadata& metadata,
                                                  std::string_view cmd_line)
    {
        try
        {
            Reaction current = bot_command_reaction(state, metadata, cmd_line);

            for (int depth = 1; std::holds_alternative<reaction::BotCmd>(current); ++depth)
            {
                if (depth > k_max_bot_cmd_depth)
                {
                    throw Error(errc::bot_cmd_depth,
                                "more than " + std::to_string(k_max_bot_cmd_depth) + " chained bot commands");
                }
                const std::string next = std::get<reaction::BotCmd>(current).line;
                current = bot_command_reaction(state, metadata, next);
            }

            return resolve(state, metadata, current);
        }
        catch (const Error& e)
        {
            std::cerr << "[dispatch] error while handling command: " << e.what() << '\n';
            return error_reply(state,
                               metadata,
                               std::string{ "Encountered error while trying to handle command: " } + e.what());
        }
    }

} // namespace irc_bot
