// C++ Standard Library
#include <atomic>
#include <string>
#include <vector>

// Boost.Asio
#include <boost/asio/io_context.hpp>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <ib/bot/outbox.hpp>
#include <ib/bot/state.hpp>
#include <ib/irc/message.hpp>

#include "test_support.hpp"

using namespace irc_bot;
using namespace irc_bot::test;

namespace
{
    OutboxRecord privmsg_record(ServerId id, std::string text)
    {
        return OutboxRecord{ .server_id = id, .reaction = LibReaction::raw(irc::make_privmsg("#test", text)) };
    }

    std::vector<std::string> lines_of(const MockConnection& conn)
    {
        std::vector<std::string> out;
        for (const auto& m : conn.sent())
        {
            out.push_back(m.to_line());
        }
        return out;
    }
} // namespace

TEST(Outbox, FullQueueDropsAndCounts)
{
    StateFixture fx;
    boost::asio::io_context ctx;
    Outbox outbox{ ctx.get_executor(), fx.state, 1 };

    EXPECT_TRUE(outbox.try_push(privmsg_record(fx.server_id, "first")));
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(outbox.try_push(privmsg_record(fx.server_id, "second")));
    const auto logged = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(logged.find("outbox full"), std::string::npos);
    EXPECT_EQ(outbox.dropped_count(), 1U);
    EXPECT_EQ(outbox.size(), 1U);

    outbox.start();
    outbox.stop();
    ctx.run();

    EXPECT_EQ(lines_of(*fx.conn), std::vector<std::string>{ "PRIVMSG #test :first" });
    EXPECT_EQ(outbox.size(), 0U);
}

TEST(Outbox, SendsInOrderAndFlattensMulti)
{
    StateFixture fx;
    boost::asio::io_context ctx;
    Outbox outbox{ ctx.get_executor(), fx.state, 8 };
    outbox.start();

    ASSERT_TRUE(outbox.try_push(privmsg_record(fx.server_id, "one")));
    ASSERT_TRUE(outbox.try_push(OutboxRecord{
        .server_id = fx.server_id,
        .reaction = LibReaction::multi({ LibReaction::raw(irc::make_privmsg("#test", "two")),
                                         LibReaction::multi({ LibReaction::raw(irc::make_privmsg("#test", "three")) }) }),
    }));
    outbox.stop();
    ctx.run();

    EXPECT_EQ(lines_of(*fx.conn),
              (std::vector<std::string>{ "PRIVMSG #test :one", "PRIVMSG #test :two", "PRIVMSG #test :three" }));
}

TEST(Outbox, UnknownServerIsDropped)
{
    StateFixture fx;
    boost::asio::io_context ctx;
    Outbox outbox{ ctx.get_executor(), fx.state, 4 };
    outbox.start();

    ASSERT_TRUE(outbox.try_push(privmsg_record(make_uuid(), "nowhere")));
    ASSERT_TRUE(outbox.try_push(privmsg_record(fx.server_id, "somewhere")));
    outbox.stop();
    ctx.run();

    EXPECT_EQ(lines_of(*fx.conn), std::vector<std::string>{ "PRIVMSG #test :somewhere" });
}

TEST(Outbox, PoisonedConnectionTableDropsTheRecord)
{
    StateFixture fx;
    ASSERT_TRUE(StateAccess::poison_connections(*fx.state));

    boost::asio::io_context ctx;
    Outbox outbox{ ctx.get_executor(), fx.state, 4 };
    outbox.start();

    ASSERT_TRUE(outbox.try_push(privmsg_record(fx.server_id, "lost")));
    outbox.stop();

    ::testing::internal::CaptureStderr();
    ctx.run();
    const auto logged = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(fx.conn->sent().empty());
    EXPECT_NE(logged.find("[outbox] warning"), std::string::npos);
    EXPECT_EQ(outbox.size(), 0U);
}

TEST(Outbox, QuitEndsTheRecordAndNotifies)
{
    StateFixture fx;
    boost::asio::io_context ctx;
    Outbox outbox{ ctx.get_executor(), fx.state, 4 };

    std::vector<ServerId> quit_on;
    outbox.set_quit_listener([&](ServerId id) { quit_on.push_back(id); });
    outbox.start();

    ASSERT_TRUE(outbox.try_push(OutboxRecord{
        .server_id = fx.server_id,
        .reaction = LibReaction::multi({ LibReaction::raw(irc::make_quit("bye")),
                                         LibReaction::raw(irc::make_privmsg("#test", "never sent")) }),
    }));
    outbox.stop();
    ctx.run();

    EXPECT_EQ(lines_of(*fx.conn), std::vector<std::string>{ "QUIT :bye" });
    EXPECT_EQ(quit_on, std::vector<ServerId>{ fx.server_id });
}

TEST(Outbox, SendFailureConsultsTheErrorHandlerOnce)
{
    std::atomic<int> handler_calls{ 0 };
    StateFixture fx{ make_config(), [&](const Error& e) -> ErrorReaction {
                        EXPECT_EQ(e.kind(), errc::send_failed);
                        handler_calls.fetch_add(1);
                        return error_reaction::Quit{ "transport trouble" };
                    } };
    fx.conn->set_failing(true);

    boost::asio::io_context ctx;
    Outbox outbox{ ctx.get_executor(), fx.state, 4 };
    int quits = 0;
    outbox.set_quit_listener([&](ServerId) { ++quits; });
    outbox.start();

    ASSERT_TRUE(outbox.try_push(privmsg_record(fx.server_id, "doomed")));
    outbox.stop();
    ctx.run();

    // The original send and the handler's QUIT both failed; the second failure is only logged.
    EXPECT_EQ(handler_calls.load(), 1);
    EXPECT_EQ(fx.conn->failed_sends(), 2);
    EXPECT_EQ(quits, 1);
}

TEST(Outbox, SendFailureWithProceedKeepsGoing)
{
    StateFixture fx;
    fx.conn->set_failing(true);

    boost::asio::io_context ctx;
    Outbox outbox{ ctx.get_executor(), fx.state, 4 };
    outbox.start();

    ASSERT_TRUE(outbox.try_push(OutboxRecord{
        .server_id = fx.server_id,
        .reaction = LibReaction::multi({ LibReaction::raw(irc::make_privmsg("#test", "a")),
                                         LibReaction::raw(irc::make_privmsg("#test", "b")) }),
    }));
    outbox.stop();
    ctx.run();

    // Each message of the record is still attempted.
    EXPECT_EQ(fx.conn->failed_sends(), 2);
}
