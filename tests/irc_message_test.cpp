// C++ Standard Library
#include <string>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <ib/irc/irc_message_parser.hpp>
#include <ib/irc/message.hpp>
#include <ib/irc/msg_prefix.hpp>

using namespace irc_bot::irc;

TEST(IrcLineParser, PrefixParamsAndTrailing)
{
    const std::string line = ":alice!al@example.org PRIVMSG #test :ib: ping now";
    const auto msg = parse_irc_line(line);

    EXPECT_EQ(msg.command, "PRIVMSG");
    EXPECT_EQ(msg.prefix, "alice!al@example.org");
    ASSERT_EQ(msg.arg_count(), 2U);
    EXPECT_EQ(msg.arg(0), "#test");
    EXPECT_EQ(msg.arg(1), "ib: ping now");
}

TEST(IrcLineParser, PingWithoutPrefix)
{
    const auto msg = parse_irc_line("PING :irc.example.org");
    EXPECT_EQ(msg.command, "PING");
    EXPECT_TRUE(msg.prefix.empty());
    EXPECT_TRUE(msg.has_trailing);
    EXPECT_EQ(msg.trailing, "irc.example.org");
}

TEST(IrcLineParser, NumericReply)
{
    const auto msg = parse_irc_line(":irc.example.org 004 ib irc.example.org ircd-1.0 iow ovb");
    EXPECT_EQ(msg.command, "004");
    EXPECT_EQ(msg.arg(0), "ib");
    EXPECT_FALSE(msg.has_trailing);
}

TEST(IrcLineParser, EmptyLineHasNoCommand)
{
    EXPECT_TRUE(parse_irc_line("").command.empty());
}

TEST(Message, PrivmsgWireForm)
{
    EXPECT_EQ(make_privmsg("#test", "hello there").to_line(), "PRIVMSG #test :hello there");
}

TEST(Message, LineBreaksCannotSmuggleASecondLine)
{
    const auto line = make_privmsg("#test", "one\r\nQUIT :bye").to_line();
    EXPECT_EQ(line.find('\r'), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(Message, ParseRawLine)
{
    const auto msg = Message::parse("PART #test :see you");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->command, "PART");
    ASSERT_EQ(msg->params.size(), 1U);
    EXPECT_EQ(msg->params[0], "#test");
    ASSERT_TRUE(msg->trailing.has_value());
    EXPECT_EQ(*msg->trailing, "see you");
}

TEST(Message, ParseUpperCasesTheCommand)
{
    const auto msg = Message::parse("quit :later");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->command, "QUIT");
    EXPECT_EQ(msg->to_line(), "QUIT :later");
}

TEST(Message, ParseRejectsEmbeddedLineBreak)
{
    EXPECT_FALSE(Message::parse("JOIN #a\r\nQUIT").has_value());
    EXPECT_FALSE(Message::parse("").has_value());
}

TEST(Message, QuitWithAndWithoutText)
{
    EXPECT_EQ(make_quit(std::nullopt).to_line(), "QUIT");
    EXPECT_EQ(make_quit("bye now").to_line(), "QUIT :bye now");
}

TEST(MsgPrefix, ParseFullAndPartial)
{
    const auto full = parse_prefix("alice!al@example.org");
    EXPECT_EQ(full.nick, "alice");
    EXPECT_EQ(full.user, "al");
    EXPECT_EQ(full.host, "example.org");
    EXPECT_EQ(full.to_string(), "alice!al@example.org");

    const auto server = parse_prefix("irc.example.org");
    EXPECT_EQ(server.nick, "irc.example.org");
    EXPECT_FALSE(server.user.has_value());
    EXPECT_FALSE(server.host.has_value());
}

TEST(OwningMsgPrefix, UpdateKeepsFieldsTheFreshPrefixLacks)
{
    OwningMsgPrefix own{ "ib!ib@" };
    own.update_from(MsgPrefix{ .nick = std::nullopt, .user = std::nullopt, .host = "host.example.org" });
    EXPECT_EQ(own.str(), "ib!ib@host.example.org");

    own.update_from(parse_prefix("ib2!~ib@other.example.org"));
    EXPECT_EQ(own.str(), "ib2!~ib@other.example.org");
    EXPECT_EQ(own.len(), own.str().size());
}
