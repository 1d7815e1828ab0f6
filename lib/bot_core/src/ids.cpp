// Boost.Uuid
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

// Core
#include <ib/bot/ids.hpp>

namespace irc_bot
{

    boost::uuids::uuid make_uuid()
    {
        // random_generator is not safe to share between threads.
        thread_local boost::uuids::random_generator gen;
        return gen();
    }

    std::string to_string(const boost::uuids::uuid& id)
    {
        return boost::uuids::to_string(id);
    }

} // namespace irc_bot
