/*
Module Name:
- trigger.hpp

Abstract:
- Runs at most one trigger for a line of text: the highest priority bucket with any
  match wins, and within it one matching trigger is picked uniformly at random.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>

// Core
#include <ib/bot/msg_metadata.hpp>
#include <ib/bot/reaction.hpp>

namespace irc_bot
{

    class State;

    struct TriggerOutcome
    {
        std::string trigger_name;
        BotCmdResult result;
    };

    // nullopt when no trigger in any bucket matches text.
    // A throwing handler yields a handler_panic LibErr rather than an exception.
    [[nodiscard]] std::optional<TriggerOutcome> run_any_matching(const State& state,
                                                                 std::string_view text,
                                                                 const MsgMetadata& metadata);

} // namespace irc_bot
