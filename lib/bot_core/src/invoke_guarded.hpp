/*
Module Name:
- invoke_guarded.hpp

Abstract:
- Runs a command or trigger handler and turns anything it throws into a handler_panic
  LibErr, so a bad handler cannot take down a worker thread.
*/
#pragma once

// C++ Standard Library
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

// Core
#include <ib/bot/error.hpp>
#include <ib/bot/reaction.hpp>

namespace irc_bot::detail
{

    template<typename Fn>
    [[nodiscard]] BotCmdResult invoke_guarded(std::string_view kind, std::string_view name, Fn&& fn)
    {
        std::string what;
        try
        {
            return fn();
        }
        catch (const std::exception& e)
        {
            what = e.what();
        }
        catch (...)
        {
            what = "<unknown exception>";
        }

        std::cerr << "[dispatch] " << kind << " \"" << name << "\" threw: " << what << '\n';
        return Error(errc::handler_panic,
                     "the " + std::string{ kind } + " \"" + std::string{ name } + "\" panicked: " + what);
    }

} // namespace irc_bot::detail
