/*
Module Name:
- msg_prefix.hpp

Abstract:
- Sender identity ("nick!user@host") as three optional fields, and the owning form the
  bot keeps of its own prefix so it can estimate how the server echoes it.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace irc_bot::irc
{

    struct MsgPrefix
    {
        std::optional<std::string> nick;
        std::optional<std::string> user;
        std::optional<std::string> host;

        // Upper bound on the rendered length, accurate to within a few bytes.
        [[nodiscard]] std::size_t len() const noexcept;

        // "nick!user@host" with absent parts left out.
        [[nodiscard]] std::string to_string() const;

        friend bool operator==(const MsgPrefix&, const MsgPrefix&) = default;
    };

    // Split a prefix. Without '!' or '@' the whole string is the nick (or server name).
    [[nodiscard]] MsgPrefix parse_prefix(std::string_view prefix);

    // The bot's best knowledge of its own prefix on one server.
    class OwningMsgPrefix
    {
    public:
        OwningMsgPrefix() = default;

        explicit OwningMsgPrefix(std::string backing) :
            backing_{ std::move(backing) }
        {
        }

        [[nodiscard]] MsgPrefix parse() const
        {
            return parse_prefix(backing_);
        }

        // Exact length of the stored prefix.
        [[nodiscard]] std::size_t len() const noexcept
        {
            return backing_.size();
        }

        [[nodiscard]] const std::string& str() const noexcept
        {
            return backing_;
        }

        // Overwrite each field that 'fresh' carries; keep the rest.
        void update_from(const MsgPrefix& fresh);

    private:
        std::string backing_;
    };

} // namespace irc_bot::irc
