/*
Module Name:
- reaction_resolver.hpp

Abstract:
- Turns an abstract Reaction into wire-ready messages: picks the reply target and
  addressee, splits text on line breaks and wraps each line so that the echoed PRIVMSG,
  prefix and CRLF included, stays within the 512 byte protocol limit.

Notes:
- The budget depends on the bot's own prefix as the server will echo it, so it is
  recomputed per message from the State prefix cache.
- Resolution reads State but never changes it; the same Reaction and State resolve to
  the same messages.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Core
#include <ib/bot/msg_metadata.hpp>
#include <ib/bot/reaction.hpp>
#include <ib/irc/message.hpp>

namespace irc_bot
{

    class State;

    // Bytes of PRIVMSG text that fit after ":<prefix> PRIVMSG <target> :" and before CRLF.
    // Throws Error(invalid_message) if nothing fits.
    [[nodiscard]] std::size_t privmsg_text_budget(std::size_t own_prefix_len, std::string_view target);

    // Largest n <= max_bytes such that s[0, n) does not end inside a UTF-8 sequence.
    [[nodiscard]] std::size_t utf8_clip_len(std::string_view s, std::size_t max_bytes) noexcept;

    // Wrap one line (no line breaks) into pieces of at most budget bytes.
    // A line that fits is returned unchanged. Otherwise pieces break at the last whitespace
    // that keeps them within budget and are trimmed; a word longer than budget is cut.
    // Pre: budget > 0
    [[nodiscard]] std::vector<std::string> wrap_line(std::string_view line, std::size_t budget);

    // PRIVMSGs to target for text, "<addressee><suffix>" prepended when addressee is non-empty.
    // Blank lines are dropped.
    [[nodiscard]] std::vector<irc::Message> compose_msg(const State& state,
                                                        ServerId server_id,
                                                        std::string_view target,
                                                        std::string_view addressee,
                                                        std::string_view text);

    // "Built with <homepage> v<version>".
    [[nodiscard]] std::string default_quit_message();

    // nullopt when there is nothing to send.
    // Throws Error on an unknown server, an unparseable RawMsg or a reply with no target.
    // BotCmd is not resolvable and throws too; the dispatcher expands those first.
    [[nodiscard]] std::optional<LibReaction> resolve(const State& state,
                                                     const MsgMetadata& metadata,
                                                     const Reaction& input);

} // namespace irc_bot
