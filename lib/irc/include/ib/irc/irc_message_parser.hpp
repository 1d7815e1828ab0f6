/*
Module Name:
- irc_message_parser.hpp

Abstract:
- Zero-copy IRC line parser for the inbound path.
- Produces views into the input line; nothing is allocated and nothing is owned.
- Grammar: ['@' tags SP] [':' prefix SP] command {SP middle} [SP ':' trailing].
*/
#pragma once

// C++ Standard Library
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

// GSL
#include <gsl/gsl>

// Core
#include <ib/utils/attributes.hpp>

namespace irc_bot::irc
{

    // Parsed IRC line - views only, no ownership.
    struct IrcMessage
    {
        static constexpr std::size_t max_params = 15; // RFC 2812 limit incl. trailing

        std::string_view command; // e.g. "PRIVMSG" or "004"
        std::array<std::string_view, max_params> params;
        uint8_t param_count = 0;
        bool has_trailing = false; // trailing present, possibly empty

        std::string_view raw_tags; // tag block without leading '@'
        std::string_view prefix; // without leading ':'
        std::string_view trailing;

        [[nodiscard]]
        IB_FORCE_INLINE auto parameters() const noexcept -> gsl::span<const std::string_view>
        {
            return { params.data(), params.data() + param_count };
        }

        // Middle params followed by trailing, as IRC sees them. PRIVMSG target is arg(0), text arg(1).
        [[nodiscard]] std::string_view arg(std::size_t i) const noexcept
        {
            if (i < param_count)
            {
                return params[i];
            }
            if (i == param_count && has_trailing)
            {
                return trailing;
            }
            return {};
        }

        [[nodiscard]] std::size_t arg_count() const noexcept
        {
            return param_count + (has_trailing ? 1U : 0U);
        }
    };

    namespace detail
    {

        // Skip runs of spaces; servers are not supposed to send them but some do.
        IB_FORCE_INLINE const char* skip_spaces(const char* ptr, const char* endp) noexcept
        {
            while (ptr < endp && *ptr == ' ')
            {
                ++ptr;
            }
            return ptr;
        }

        IB_FORCE_INLINE const char* find_space(const char* ptr, const char* endp) noexcept
        {
            while (ptr < endp && *ptr != ' ')
            {
                ++ptr;
            }
            return ptr;
        }

        // Split middle params on spaces; a token starting with ':' swallows the rest of the line.
        IB_FORCE_INLINE void parse_params_and_trailing(const char* ptr, const char* endp, IrcMessage& msg) noexcept
        {
            for (;;)
            {
                ptr = skip_spaces(ptr, endp);
                if (ptr >= endp)
                {
                    return;
                }

                if (*ptr == ':' || msg.param_count + 1 == IrcMessage::max_params)
                {
                    // Past the last middle slot everything left is trailing, colon or not.
                    const char* t = (*ptr == ':') ? ptr + 1 : ptr;
                    msg.trailing = { t, gsl::narrow_cast<std::size_t>(endp - t) };
                    msg.has_trailing = true;
                    return;
                }

                const char* token_end = find_space(ptr, endp);
                msg.params[msg.param_count++] = { ptr, gsl::narrow_cast<std::size_t>(token_end - ptr) };
                ptr = token_end;
            }
        }

    } // namespace detail

    // Parse one raw IRC line (CRLF already stripped) into an IrcMessage.
    // All views refer to 'raw'. An empty command means the line was not a message.
    // Post: param_count < max_params.
    [[nodiscard]]
    IB_FORCE_INLINE auto parse_irc_line(std::string_view raw) noexcept -> IrcMessage
    {
        Expects(raw.empty() || raw.data() != nullptr);

        IrcMessage msg{};
        const char* ptr = raw.data();
        const char* const endp = ptr + raw.size();

        // [1] tags
        if (ptr < endp && *ptr == '@')
        {
            ++ptr;
            const char* space_pos = detail::find_space(ptr, endp);
            msg.raw_tags = { ptr, gsl::narrow_cast<std::size_t>(space_pos - ptr) };
            ptr = detail::skip_spaces(space_pos, endp);
        }

        // [2] optional prefix
        if (ptr < endp && *ptr == ':')
        {
            ++ptr;
            const char* space_pos = detail::find_space(ptr, endp);
            msg.prefix = { ptr, gsl::narrow_cast<std::size_t>(space_pos - ptr) };
            ptr = detail::skip_spaces(space_pos, endp);
        }

        // [3] command
        {
            const char* space_pos = detail::find_space(ptr, endp);
            msg.command = { ptr, gsl::narrow_cast<std::size_t>(space_pos - ptr) };
            ptr = space_pos;
        }

        // [4] params and trailing
        detail::parse_params_and_trailing(ptr, endp, msg);
        Ensures(msg.param_count < IrcMessage::max_params);
        return msg;
    }

} // namespace irc_bot::irc
