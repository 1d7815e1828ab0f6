#pragma once

/*
Module: default_module.hpp

Purpose:
- Declare the built-in "default" module: the commands every deployment expects.

Commands:
- join <channel>             (Admin)  - JOIN the given channel(s)
- part [channel] [message]   (Admin)  - PART the given or current channel
- quit [message]             (Admin)  - QUIT every server and stop
- ping                       (Public) - answer "pong"
- source                     (Public) - answer with the project homepage
- help [command|list <name>] (Public) - describe a command or list commands
*/

// C++ Standard Library
#include <memory>

// Core
#include <ib/bot/module.hpp>

namespace app
{

    [[nodiscard]] std::shared_ptr<const irc_bot::Module> default_module();

} // namespace app
