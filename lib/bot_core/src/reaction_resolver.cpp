// Reaction resolution and line wrapping.

// Why:
// - Wrap against the echoed line length, not the sent one: the server prepends our
//   prefix before relaying, and that relayed line is what must fit in 512 bytes.
// - Clip on UTF-8 boundaries so a hard cut never produces an invalid sequence.

// C++ Standard Library
#include <utility>

// GSL
#include <gsl/gsl>

// Core
#include <ib/bot/error.hpp>
#include <ib/bot/reaction_resolver.hpp>
#include <ib/bot/state.hpp>
#include <ib/utils/attributes.hpp>

namespace irc_bot
{

    namespace
    {
        // ":" + prefix + " PRIVMSG " + target + " :" + text + CRLF
        // two colons, three spaces, CRLF.
        constexpr std::size_t k_privmsg_punctuation = 2 + 3 + 2;
        constexpr std::string_view k_privmsg = "PRIVMSG";

        IB_FORCE_INLINE bool is_space(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\v' || c == '\f' || c == '\r' || c == '\n';
        }

        std::string_view trim(std::string_view s) noexcept
        {
            std::size_t b = 0;
            std::size_t e = s.size();
            while (b < e && is_space(s[b]))
                ++b;
            while (e > b && is_space(s[e - 1]))
                --e;
            return s.substr(b, e - b);
        }

        std::optional<LibReaction> collect(std::vector<LibReaction> parts)
        {
            switch (parts.size())
            {
            case 0:
                return std::nullopt;
            case 1:
                return std::move(parts.front());
            default:
                return LibReaction::multi(std::move(parts));
            }
        }

        std::optional<LibReaction> to_lib_reaction(std::vector<irc::Message> msgs)
        {
            std::vector<LibReaction> parts;
            parts.reserve(msgs.size());
            for (auto& m : msgs)
            {
                parts.push_back(LibReaction::raw(std::move(m)));
            }
            return collect(std::move(parts));
        }

        struct ReplyTarget
        {
            std::string target;
            std::string addressee;
        };

        ReplyTarget reply_target(const State& state, const MsgMetadata& metadata)
        {
            const auto& sender = metadata.prefix.nick;
            if (metadata.dest.target == state.nick(metadata.dest.server_id))
            {
                if (!sender || sender->empty())
                {
                    throw Error(errc::nickname_unknown, "sender of a private message");
                }
                return ReplyTarget{ .target = *sender, .addressee = {} };
            }
            return ReplyTarget{ .target = metadata.dest.target, .addressee = sender.value_or("") };
        }
    } // namespace

    std::size_t privmsg_text_budget(std::size_t own_prefix_len, std::string_view target)
    {
        const std::size_t overhead = own_prefix_len + k_privmsg.size() + target.size() + k_privmsg_punctuation;
        if (IB_UNLIKELY(overhead >= irc::kMaxLineBytes))
        {
            throw Error(errc::invalid_message,
                        "no room for message text to \"" + std::string{ target } + "\" within " +
                            std::to_string(irc::kMaxLineBytes) + " bytes");
        }
        return irc::kMaxLineBytes - overhead;
    }

    std::size_t utf8_clip_len(std::string_view s, std::size_t max_bytes) noexcept
    {
        if (s.size() <= max_bytes)
        {
            return s.size();
        }

        // Back off while s[i] is a continuation byte; s[0, i) then ends on a boundary.
        std::size_t i = max_bytes;
        while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
        {
            --i;
        }
        return i;
    }

    std::vector<std::string> wrap_line(std::string_view line, std::size_t budget)
    {
        Expects(budget > 0);

        std::vector<std::string> out;
        if (line.size() <= budget)
        {
            out.emplace_back(line);
            return out;
        }

        std::size_t pos = 0;
        while (pos < line.size())
        {
            while (pos < line.size() && is_space(line[pos]))
                ++pos;
            if (pos >= line.size())
                break;

            const std::string_view rest = line.substr(pos);
            if (rest.size() <= budget)
            {
                out.emplace_back(trim(rest));
                break;
            }

            // The byte at index budget may be the break itself: a piece of exactly budget bytes.
            const std::string_view window = rest.substr(0, budget + 1);
            std::size_t cut = window.size();
            while (cut > 0 && !is_space(window[cut - 1]))
                --cut;

            if (cut > 1)
            {
                // window[cut - 1] is whitespace; the piece is everything before it.
                out.emplace_back(trim(rest.substr(0, cut - 1)));
                pos += cut - 1;
                continue;
            }

            // One word longer than the budget.
            std::size_t n = utf8_clip_len(rest, budget);
            if (n == 0)
            {
                // Not UTF-8 at all; a byte cut is the best we can do.
                n = budget;
            }
            out.emplace_back(rest.substr(0, n));
            pos += n;
        }

        Ensures(!out.empty());
        return out;
    }

    std::vector<irc::Message> compose_msg(const State& state,
                                          ServerId server_id,
                                          std::string_view target,
                                          std::string_view addressee,
                                          std::string_view text)
    {
        std::string full;
        if (!addressee.empty())
        {
            full.append(addressee);
            full.append(state.addressee_suffix());
        }
        full.append(text);

        const std::size_t budget = privmsg_text_budget(state.prefix_len(server_id), target);

        std::vector<irc::Message> out;
        std::string_view rest{ full };
        while (!rest.empty())
        {
            const auto nl = rest.find('\n');
            std::string_view line = rest.substr(0, nl);
            rest = (nl == std::string_view::npos) ? std::string_view{} : rest.substr(nl + 1);

            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }
            if (trim(line).empty())
            {
                continue;
            }

            for (auto& piece : wrap_line(line, budget))
            {
                out.push_back(irc::make_privmsg(target, piece));
            }
        }
        return out;
    }

    std::string default_quit_message()
    {
        return "Built with <" + std::string{ State::framework_homepage() } + "> v" +
               std::string{ State::framework_version() };
    }

    std::optional<LibReaction> resolve(const State& state, const MsgMetadata& metadata, const Reaction& input)
    {
        const auto server_id = metadata.dest.server_id;

        auto compose_all = [&](const std::vector<std::string>& texts, bool addressed) -> std::optional<LibReaction> {
            const auto rt = reply_target(state, metadata);
            std::vector<LibReaction> parts;
            for (const auto& text : texts)
            {
                if (auto r = to_lib_reaction(compose_msg(state, server_id, rt.target, addressed ? rt.addressee : "", text)))
                {
                    parts.push_back(std::move(*r));
                }
            }
            return collect(std::move(parts));
        };

        auto compose_one = [&](const std::string& text, bool addressed) -> std::optional<LibReaction> {
            const auto rt = reply_target(state, metadata);
            return to_lib_reaction(compose_msg(state, server_id, rt.target, addressed ? rt.addressee : "", text));
        };

        return std::visit(
            [&](const auto& r) -> std::optional<LibReaction> {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, reaction::None>)
                {
                    return std::nullopt;
                }
                else if constexpr (std::is_same_v<T, reaction::Msg>)
                {
                    return compose_one(r.text, false);
                }
                else if constexpr (std::is_same_v<T, reaction::Msgs>)
                {
                    return compose_all(r.texts, false);
                }
                else if constexpr (std::is_same_v<T, reaction::Reply>)
                {
                    return compose_one(r.text, true);
                }
                else if constexpr (std::is_same_v<T, reaction::Replies>)
                {
                    return compose_all(r.texts, true);
                }
                else if constexpr (std::is_same_v<T, reaction::RawMsg>)
                {
                    auto msg = irc::Message::parse(r.line);
                    if (!msg)
                    {
                        throw Error(errc::invalid_message, "cannot parse raw message \"" + r.line + "\"");
                    }
                    return LibReaction::raw(std::move(*msg));
                }
                else if constexpr (std::is_same_v<T, reaction::BotCmd>)
                {
                    // Expanded by handle_bot_command before it reaches here.
                    throw Error(errc::bot_cmd_depth, "unexpanded bot command \"" + r.line + "\"");
                }
                else
                {
                    static_assert(std::is_same_v<T, reaction::Quit>);
                    return LibReaction::raw(irc::make_quit(r.text ? std::string_view{ *r.text }
                                                                  : std::string_view{ default_quit_message() }));
                }
            },
            input);
    }

} // namespace irc_bot
