// C++ Standard Library
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <ib/bot/error.hpp>
#include <ib/bot/reaction_resolver.hpp>
#include <ib/bot/state.hpp>
#include <ib/irc/message.hpp>

#include "test_support.hpp"

using namespace irc_bot;
using namespace irc_bot::test;

namespace
{
    std::vector<std::string> words_of(std::string_view text)
    {
        std::vector<std::string> out;
        std::istringstream in{ std::string{ text } };
        std::string w;
        while (in >> w)
        {
            out.push_back(w);
        }
        return out;
    }

    std::vector<std::string> words_of(const std::vector<std::string>& pieces)
    {
        std::vector<std::string> out;
        for (const auto& p : pieces)
        {
            const auto w = words_of(p);
            out.insert(out.end(), w.begin(), w.end());
        }
        return out;
    }

    // n words "w0 w1 w2 ..." of varying length.
    std::string sample_text(int n)
    {
        std::string out;
        for (int i = 0; i < n; ++i)
        {
            if (i)
            {
                out.push_back(' ');
            }
            out.append("w").append(std::to_string(i)).append(static_cast<std::size_t>(i % 7), 'x');
        }
        return out;
    }

    // Make the cached prefix exactly len bytes long.
    void set_prefix_len(StateFixture& fx, std::size_t len)
    {
        const std::size_t base = std::string{ "ib!ib@" }.size();
        fx.state->update_prefix(fx.server_id, prefix("ib", "ib", std::string(len - base, 'h')));
        ASSERT_EQ(fx.state->prefix_len(fx.server_id), len);
    }
} // namespace

TEST(PrivmsgBudget, CountsTheEchoedLine)
{
    // ":" prefix " PRIVMSG " target " :" text CRLF
    EXPECT_EQ(privmsg_text_budget(93, "#test"), 400U);
    EXPECT_EQ(privmsg_text_budget(0, "x"), 512U - 7U - 1U - 7U);
    EXPECT_THROW((void)privmsg_text_budget(500, "#test"), Error);
}

TEST(Utf8Clip, NeverEndsInsideASequence)
{
    const std::string s = "ab\xC3\xA9" "cd"; // "abécd"
    EXPECT_EQ(utf8_clip_len(s, 10), s.size());
    EXPECT_EQ(utf8_clip_len(s, 4), 4U);
    EXPECT_EQ(utf8_clip_len(s, 3), 2U);
    EXPECT_EQ(utf8_clip_len(s, 2), 2U);
}

TEST(WrapLine, ShortLineIsUnchanged)
{
    const auto pieces = wrap_line("  keep  my spacing ", 100);
    ASSERT_EQ(pieces.size(), 1U);
    EXPECT_EQ(pieces[0], "  keep  my spacing ");
}

TEST(WrapLine, EveryPieceFitsAndNoWordIsLost)
{
    const std::string text = sample_text(300);
    for (std::size_t budget : { 10U, 17U, 40U, 99U, 400U })
    {
        const auto pieces = wrap_line(text, budget);
        for (const auto& p : pieces)
        {
            EXPECT_LE(p.size(), budget) << "budget " << budget;
            EXPECT_FALSE(p.empty());
        }
        EXPECT_EQ(words_of(pieces), words_of(text)) << "budget " << budget;
    }
}

TEST(WrapLine, PieceMayUseTheWholeBudget)
{
    const auto pieces = wrap_line("aaaa bbbb cccc", 9);
    ASSERT_EQ(pieces.size(), 2U);
    EXPECT_EQ(pieces[0], "aaaa bbbb");
    EXPECT_EQ(pieces[1], "cccc");
}

TEST(WrapLine, OverlongWordIsCutAtExactlyTheBudget)
{
    const std::string word(25, 'z');
    const auto pieces = wrap_line(word, 10);
    ASSERT_EQ(pieces.size(), 3U);
    EXPECT_EQ(pieces[0].size(), 10U);
    EXPECT_EQ(pieces[1].size(), 10U);
    EXPECT_EQ(pieces[2].size(), 5U);
}

TEST(WrapLine, HardCutRespectsUtf8)
{
    // Nine two-byte characters, budget 5: pieces of 4, 4, 4, 4, 2 bytes.
    std::string word;
    for (int i = 0; i < 9; ++i)
    {
        word.append("\xC3\xA9");
    }
    const auto pieces = wrap_line(word, 5);
    std::string joined;
    for (const auto& p : pieces)
    {
        EXPECT_LE(p.size(), 5U);
        EXPECT_EQ(p.size() % 2, 0U);
        joined += p;
    }
    EXPECT_EQ(joined, word);
}

TEST(Resolve, LongReplyAddressesOnlyTheFirstLine)
{
    StateFixture fx;
    set_prefix_len(fx, 93);

    const std::string text = sample_text(120);
    ASSERT_GE(text.size(), 600U);

    const auto md = channel_msg(fx.server_id, prefix("alice", "alice", "h"));
    const auto lib = resolve(*fx.state, md, reaction::Reply{ text });
    const auto texts = privmsg_texts(lib);

    ASSERT_GE(texts.size(), 2U);
    EXPECT_EQ(texts[0].rfind("alice: ", 0), 0U);
    for (std::size_t i = 0; i < texts.size(); ++i)
    {
        EXPECT_LE(texts[i].size(), 400U);
        if (i > 0)
        {
            EXPECT_NE(texts[i].rfind("alice: ", 0), 0U);
        }
    }

    for (const auto& m : lib->flatten())
    {
        EXPECT_EQ(m.params, std::vector<std::string>{ "#test" });
        // What the server will relay: our prefix in front, CRLF at the end.
        EXPECT_LE(1 + 93 + 1 + m.to_line().size() + 2, irc::kMaxLineBytes);
    }

    auto expected = words_of(text);
    expected.insert(expected.begin(), "alice:");
    EXPECT_EQ(words_of(texts), expected);
}

TEST(Resolve, IsIdempotent)
{
    StateFixture fx;
    const auto md = channel_msg(fx.server_id, prefix("alice", "alice", "h"));
    const Reaction input = reaction::Replies{ { sample_text(150), "second\nthird" } };

    EXPECT_EQ(resolve(*fx.state, md, input), resolve(*fx.state, md, input));
}

TEST(Resolve, PrivateReplyGoesToTheSenderUnaddressed)
{
    StateFixture fx;
    const auto lib = resolve(*fx.state, private_msg(fx.server_id, prefix("alice", "alice", "h")), reaction::Reply{ "hi" });

    ASSERT_TRUE(lib.has_value());
    const auto* raw = lib->as_raw();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(raw->to_line(), "PRIVMSG alice :hi");
}

TEST(Resolve, MsgIsNotAddressed)
{
    StateFixture fx;
    const auto md = channel_msg(fx.server_id, prefix("alice", "alice", "h"));
    EXPECT_EQ(privmsg_texts(resolve(*fx.state, md, reaction::Msg{ "hello" })), std::vector<std::string>{ "hello" });
}

TEST(Resolve, LineBreaksSplitAndBlankLinesDrop)
{
    StateFixture fx;
    const auto md = channel_msg(fx.server_id, prefix("alice", "alice", "h"));
    const auto texts = privmsg_texts(resolve(*fx.state, md, reaction::Msg{ "one\r\n\n  \ntwo" }));
    EXPECT_EQ(texts, (std::vector<std::string>{ "one", "two" }));
}

TEST(Resolve, NoneAndEmptyResolveToNothing)
{
    StateFixture fx;
    const auto md = channel_msg(fx.server_id, prefix("alice", "alice", "h"));
    EXPECT_FALSE(resolve(*fx.state, md, reaction::None{}).has_value());
    EXPECT_FALSE(resolve(*fx.state, md, reaction::Msgs{}).has_value());
}

TEST(Resolve, RawMsgIsParsedOrRejected)
{
    StateFixture fx;
    const auto md = channel_msg(fx.server_id, prefix("alice", "alice", "h"));

    const auto lib = resolve(*fx.state, md, reaction::RawMsg{ "JOIN #elsewhere" });
    ASSERT_TRUE(lib.has_value());
    EXPECT_EQ(lib->as_raw()->to_line(), "JOIN #elsewhere");

    try
    {
        (void)resolve(*fx.state, md, reaction::RawMsg{ "" });
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), errc::invalid_message);
    }
}

TEST(Resolve, QuitUsesTheDefaultMessage)
{
    StateFixture fx;
    const auto md = channel_msg(fx.server_id, prefix("alice", "alice", "h"));

    const auto plain = resolve(*fx.state, md, reaction::Quit{});
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->as_raw()->trailing, default_quit_message());

    const auto custom = resolve(*fx.state, md, reaction::Quit{ "bye" });
    EXPECT_EQ(custom->as_raw()->to_line(), "QUIT :bye");
}
