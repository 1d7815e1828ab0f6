// C++ Standard Library
#include <iostream>

// Core
#include <ib/bot/reaction.hpp>

namespace irc_bot
{

    ErrorHandler default_error_handler()
    {
        return [](const Error& e) -> ErrorReaction {
            std::cerr << "[bot] error: " << e.what() << '\n';
            return error_reaction::Proceed{};
        };
    }

} // namespace irc_bot
