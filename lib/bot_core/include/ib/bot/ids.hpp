/*
Module Name:
- ids.hpp

Abstract:
- Process-unique identifiers for server connections and loaded modules.
*/
#pragma once

// C++ Standard Library
#include <string>

// Boost.Uuid
#include <boost/uuid/uuid.hpp>

namespace irc_bot
{

    using ServerId = boost::uuids::uuid;
    using ModuleId = boost::uuids::uuid;

    // Random (v4) UUID. Thread-safe.
    [[nodiscard]] boost::uuids::uuid make_uuid();

    [[nodiscard]] std::string to_string(const boost::uuids::uuid& id);

} // namespace irc_bot
