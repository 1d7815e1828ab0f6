/*
Module Name:
- dispatch.hpp

Abstract:
- Decides whether a PRIVMSG is addressed to the bot and turns an addressed command line
  into messages: command lookup, authorization, the guarded handler call, the trigger
  fallback, failure replies and reaction resolution.
- Everything here is synchronous and runs on a worker thread; the harness owns the
  threading and the outbox.

Notes:
- A Quit reaction is honoured only from an Admin level command; from anything else it
  is replaced by an internal-error reply.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>

// Core
#include <ib/bot/msg_metadata.hpp>
#include <ib/bot/reaction.hpp>

namespace irc_bot
{

    class State;

    // Sent by the bot to itself so the server echoes back its full prefix.
    inline constexpr std::string_view k_update_prefix_sentinel = "!!! UPDATE MESSAGE PREFIX !!!";

    // How many BotCmd reactions may chain before the chain is treated as a loop.
    inline constexpr int k_max_bot_cmd_depth = 8;

    // True when target is nick, or text is nick, or text starts with nick followed by ':' or ','.
    [[nodiscard]] bool is_msg_to_nick(std::string_view target, std::string_view text, std::string_view nick) noexcept;

    // The command line of an addressed message, trimmed; nullopt when not addressed.
    [[nodiscard]] std::optional<std::string_view> parse_msg_to_nick(std::string_view target,
                                                                    std::string_view text,
                                                                    std::string_view nick) noexcept;

    // Look up, authorize and run one command. nullopt when no command has that name.
    [[nodiscard]] std::optional<BotCmdResult> run_bot_command(const State& state,
                                                              const MsgMetadata& metadata,
                                                              std::string_view name,
                                                              std::string_view arg);

    // Reply text for a failed result; Ok passes its reaction through.
    // usage is only used for SyntaxErr.
    [[nodiscard]] Reaction result_to_reaction(std::string_view feature_name, std::string_view usage, BotCmdResult result);

    // Command, else matching trigger, else an "Unknown command" reply.
    [[nodiscard]] Reaction bot_command_reaction(const State& state, const MsgMetadata& metadata, std::string_view cmd_line);

    // bot_command_reaction with BotCmd reactions expanded, then resolved.
    // Any failure along the way becomes a PRIVMSG describing it, so this does not throw Error.
    [[nodiscard]] std::optional<LibReaction> handle_bot_command(const State& state,
                                                                const MsgMetadata& metadata,
                                                                std::string_view cmd_line);

} // namespace irc_bot
