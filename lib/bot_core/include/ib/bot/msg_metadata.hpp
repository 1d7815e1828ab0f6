/*
Module Name:
- msg_metadata.hpp

Abstract:
- Where an inbound message came from and where it was sent, carried unchanged from
  dispatch to reaction resolution.
*/
#pragma once

// C++ Standard Library
#include <string>

// Core
#include <ib/bot/ids.hpp>
#include <ib/irc/msg_prefix.hpp>

namespace irc_bot
{

    struct MsgDest
    {
        ServerId server_id{};
        // Channel name, or the bot's nick for a private message.
        std::string target;

        friend bool operator==(const MsgDest&, const MsgDest&) = default;
    };

    struct MsgMetadata
    {
        MsgDest dest;
        irc::MsgPrefix prefix;

        friend bool operator==(const MsgMetadata&, const MsgMetadata&) = default;
    };

} // namespace irc_bot
