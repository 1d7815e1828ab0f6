/*
Module Name:
- reaction.hpp

Abstract:
- Reaction: what a handler wants the bot to do, independent of the wire.
- BotCmdResult: a Reaction or one of the ways a command can fail.
- LibReaction: wire-ready messages produced by the resolver.
- ErrorReaction and ErrorHandler: the operator's policy for framework errors.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Core
#include <ib/bot/error.hpp>
#include <ib/irc/message.hpp>

namespace irc_bot
{

    namespace reaction
    {
        struct None
        {
            friend bool operator==(const None&, const None&) = default;
        };

        // Sent to the reply target without addressing the sender.
        struct Msg
        {
            std::string text;
            friend bool operator==(const Msg&, const Msg&) = default;
        };

        struct Msgs
        {
            std::vector<std::string> texts;
            friend bool operator==(const Msgs&, const Msgs&) = default;
        };

        // Like Msg, but in a channel the first line is prefixed "<nick><suffix>".
        struct Reply
        {
            std::string text;
            friend bool operator==(const Reply&, const Reply&) = default;
        };

        struct Replies
        {
            std::vector<std::string> texts;
            friend bool operator==(const Replies&, const Replies&) = default;
        };

        // A complete protocol line, sent verbatim.
        struct RawMsg
        {
            std::string line;
            friend bool operator==(const RawMsg&, const RawMsg&) = default;
        };

        // Run another bot command as if the same sender had issued it.
        struct BotCmd
        {
            std::string line;
            friend bool operator==(const BotCmd&, const BotCmd&) = default;
        };

        struct Quit
        {
            std::optional<std::string> text;
            friend bool operator==(const Quit&, const Quit&) = default;
        };
    } // namespace reaction

    using Reaction = std::variant<reaction::None,
                                  reaction::Msg,
                                  reaction::Msgs,
                                  reaction::Reply,
                                  reaction::Replies,
                                  reaction::RawMsg,
                                  reaction::BotCmd,
                                  reaction::Quit>;

    namespace result
    {
        struct Ok
        {
            Reaction reaction;
        };

        struct Unauthorized
        {
        };

        struct ParamUnauthorized
        {
            std::string param;
        };

        // Answered with the command's usage string.
        struct SyntaxErr
        {
        };

        struct ArgMissing
        {
            std::string arg;
        };

        // The argument is optional in a channel but required in a private message.
        struct ArgMissing1To1
        {
            std::string arg;
        };

        struct LibErr
        {
            Error error;
        };

        struct UserErrMsg
        {
            std::string text;
        };

        struct BotErrMsg
        {
            std::string text;
        };
    } // namespace result

    namespace detail
    {
        template<typename T, typename Variant>
        struct is_variant_alternative;

        template<typename T, typename... Ts>
        struct is_variant_alternative<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)>
        {
        };
    } // namespace detail

    class BotCmdResult
    {
    public:
        using Variant = std::variant<result::Ok,
                                     result::Unauthorized,
                                     result::ParamUnauthorized,
                                     result::SyntaxErr,
                                     result::ArgMissing,
                                     result::ArgMissing1To1,
                                     result::LibErr,
                                     result::UserErrMsg,
                                     result::BotErrMsg>;

        // Any result alternative.
        template<typename T>
            requires detail::is_variant_alternative<std::remove_cvref_t<T>, Variant>::value
        BotCmdResult(T&& alt) :
            value_{ std::forward<T>(alt) }
        {
        }

        // A Reaction, or any single reaction struct, means success.
        template<typename T>
            requires std::constructible_from<Reaction, T&&> &&
                     (!detail::is_variant_alternative<std::remove_cvref_t<T>, Variant>::value)
        BotCmdResult(T&& r) :
            value_{ result::Ok{ Reaction{ std::forward<T>(r) } } }
        {
        }

        BotCmdResult(Error e) :
            value_{ result::LibErr{ std::move(e) } }
        {
        }

        [[nodiscard]] const Variant& get() const noexcept
        {
            return value_;
        }

        template<typename T>
        [[nodiscard]] const T* get_if() const noexcept
        {
            return std::get_if<T>(&value_);
        }

        template<typename T>
        [[nodiscard]] bool is() const noexcept
        {
            return std::holds_alternative<T>(value_);
        }

        [[nodiscard]] Variant release() &&
        {
            return std::move(value_);
        }

    private:
        Variant value_;
    };

    class LibReaction
    {
    public:
        using Multi = std::vector<LibReaction>;

        [[nodiscard]] static LibReaction raw(irc::Message msg)
        {
            return LibReaction{ std::move(msg) };
        }

        [[nodiscard]] static LibReaction multi(Multi parts)
        {
            return LibReaction{ std::move(parts) };
        }

        [[nodiscard]] const irc::Message* as_raw() const noexcept
        {
            return std::get_if<irc::Message>(&value_);
        }

        [[nodiscard]] const Multi* as_multi() const noexcept
        {
            return std::get_if<Multi>(&value_);
        }

        // Depth-first, in order.
        [[nodiscard]] std::vector<irc::Message> flatten() const
        {
            std::vector<irc::Message> out;
            flatten_into(out);
            return out;
        }

        friend bool operator==(const LibReaction&, const LibReaction&) = default;

    private:
        explicit LibReaction(irc::Message msg) :
            value_{ std::move(msg) }
        {
        }

        explicit LibReaction(Multi parts) :
            value_{ std::move(parts) }
        {
        }

        void flatten_into(std::vector<irc::Message>& out) const
        {
            if (const auto* m = as_raw())
            {
                out.push_back(*m);
                return;
            }
            for (const auto& part : *as_multi())
            {
                part.flatten_into(out);
            }
        }

        std::variant<irc::Message, Multi> value_;
    };

    namespace error_reaction
    {
        struct Proceed
        {
        };

        struct Quit
        {
            std::optional<std::string> text;
        };
    } // namespace error_reaction

    using ErrorReaction = std::variant<error_reaction::Proceed, error_reaction::Quit>;

    /// Operator policy for registry and send-time errors.
    using ErrorHandler = std::function<ErrorReaction(const Error&)>;

    /// Logs the error to std::cerr and proceeds.
    [[nodiscard]] ErrorHandler default_error_handler();

} // namespace irc_bot
