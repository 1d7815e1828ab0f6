/*
Module Name:
- error.hpp

Abstract:
- Defines irc_bot error codes and a std::error_category so failures can travel as
  std::error_code. Error wraps a code plus a detail string and is what the registry,
  the dispatch pipeline and the outbox throw or hand to the ErrorHandler.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>

namespace irc_bot
{

    enum class errc
    {
        module_registry_clash = 1,
        feature_registry_clash,
        invalid_feature_name,
        invalid_trigger_pattern,
        handler_panic,
        module_load,
        lock_poisoned,
        unknown_server,
        nickname_unknown,
        invalid_message,
        outbox_full,
        bot_cmd_depth,
        send_failed,
    };

    // Category for irc_bot errors.
    struct error_category_impl final : std::error_category
    {
        const char* name() const noexcept override
        {
            return "irc_bot";
        }
        std::string message(int ev) const override
        {
            switch (static_cast<errc>(ev))
            {
            case errc::module_registry_clash:
                return "module registry clash";
            case errc::feature_registry_clash:
                return "feature registry clash";
            case errc::invalid_feature_name:
                return "invalid feature name";
            case errc::invalid_trigger_pattern:
                return "invalid trigger pattern";
            case errc::handler_panic:
                return "handler panicked";
            case errc::module_load:
                return "module on-load callback failed";
            case errc::lock_poisoned:
                return "lock poisoned";
            case errc::unknown_server:
                return "unknown server";
            case errc::nickname_unknown:
                return "nickname unknown";
            case errc::invalid_message:
                return "invalid protocol message";
            case errc::outbox_full:
                return "outbox full";
            case errc::bot_cmd_depth:
                return "bot command recursion too deep";
            case errc::send_failed:
                return "send failed";
            }
            return "unknown irc_bot error";
        }
    };

    inline const std::error_category& error_category()
    {
        static error_category_impl cat;
        return cat;
    }

    inline std::error_code make_error_code(errc e) noexcept
    {
        return { static_cast<int>(e), error_category() };
    }

    class Error : public std::system_error
    {
    public:
        Error(errc code, const std::string& detail) :
            std::system_error{ make_error_code(code), detail }
        {
        }

        [[nodiscard]] errc kind() const noexcept
        {
            return static_cast<errc>(code().value());
        }
    };

} // namespace irc_bot

// Enable implicit conversion to std::error_code for irc_bot::errc.
namespace std
{
    template<>
    struct is_error_code_enum<irc_bot::errc> : true_type
    {
    };
} // namespace std
