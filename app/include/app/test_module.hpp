#pragma once

/*
Module: test_module.hpp

Purpose:
- Declare the built-in "test" module, used to exercise the framework on a live server.

Commands:
- test-line-wrap       (Admin) - reply with a paragraph long enough to need wrapping
- test-panic-catching  (Admin) - throw from the handler

Triggers:
- test-trigger (Low) - answers a greeting aimed at the bot
*/

// C++ Standard Library
#include <memory>

// Core
#include <ib/bot/module.hpp>

namespace app
{

    [[nodiscard]] std::shared_ptr<const irc_bot::Module> test_module();

} // namespace app
