// C++ Standard Library
#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <ib/bot/error.hpp>
#include <ib/bot/module.hpp>
#include <ib/bot/state.hpp>

#include "test_support.hpp"

using namespace irc_bot;
using namespace irc_bot::test;

namespace
{
    std::shared_ptr<const Module> module_with_command(std::string module_name, std::string cmd_name, std::string reply)
    {
        return ModuleBuilder{ std::move(module_name) }
            .command(std::move(cmd_name), "", "test command", AuthLevel::Public,
                     [reply](const HandlerContext&, std::string_view) -> BotCmdResult { return reaction::Msg{ reply }; })
            .end();
    }

    // The Msg text a registered command answers with.
    std::string answer_of(const StateFixture& fx, std::string_view cmd_name)
    {
        const auto cmd = fx.state->command(cmd_name);
        if (!cmd)
        {
            return "<missing>";
        }
        const auto md = channel_msg(fx.server_id, prefix("alice", "alice", "h"));
        const HandlerContext ctx{ .state = *fx.state, .metadata = md, .feature_name = cmd->name };
        const auto res = cmd->handler->invoke(ctx, "");
        const auto* ok = res.get_if<result::Ok>();
        if (!ok)
        {
            return "<not ok>";
        }
        return std::get<reaction::Msg>(ok->reaction).text;
    }

    bool has_error(const std::vector<Error>& errors, errc kind)
    {
        return std::any_of(errors.begin(), errors.end(), [kind](const Error& e) { return e.kind() == kind; });
    }
} // namespace

TEST(ModuleBuilder, RejectsWhitespaceInCommandName)
{
    ModuleBuilder b{ "m" };
    auto fn = [](const HandlerContext&, std::string_view) -> BotCmdResult { return reaction::None{}; };

    try
    {
        b.command("two words", "", "", AuthLevel::Public, fn);
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), errc::invalid_feature_name);
    }
    EXPECT_THROW(b.command("tab\tname", "", "", AuthLevel::Public, fn), Error);
    EXPECT_THROW(b.command("", "", "", AuthLevel::Public, fn), Error);
    EXPECT_NO_THROW(b.command("one-word", "", "", AuthLevel::Public, fn));
}

TEST(ModuleBuilder, RejectsInvalidTriggerPattern)
{
    ModuleBuilder b{ "m" };
    auto fn = [](const HandlerContext&, const std::smatch&) -> BotCmdResult { return reaction::None{}; };

    try
    {
        b.trigger("bad", "(unclosed", "", TriggerPriority::Medium, fn);
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), errc::invalid_trigger_pattern);
    }
}

TEST(Registry, AddRejectsACollidingModuleAndKeepsTheOldEntry)
{
    StateFixture fx;
    EXPECT_TRUE(fx.state->load_module(module_with_command("a", "x", "from a"), LoadMode::Add).empty());

    const auto errors = fx.state->load_module(module_with_command("b", "x", "from b"), LoadMode::Add);
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].kind(), errc::feature_registry_clash);
    EXPECT_EQ(answer_of(fx, "x"), "from a");
}

TEST(Registry, AddRejectsAModuleWithTheSameName)
{
    StateFixture fx;
    EXPECT_TRUE(fx.state->load_module(module_with_command("a", "x", "first"), LoadMode::Add).empty());

    const auto errors = fx.state->load_module(module_with_command("a", "y", "second"), LoadMode::Add);
    EXPECT_TRUE(has_error(errors, errc::module_registry_clash));
    EXPECT_FALSE(fx.state->command("y").has_value());
}

TEST(Registry, ReplaceOnlyOverwritesEntriesOfTheSameModule)
{
    StateFixture fx;
    ASSERT_TRUE(fx.state->load_module(module_with_command("a", "x", "a v1"), LoadMode::Add).empty());

    EXPECT_TRUE(fx.state->load_module(module_with_command("a", "x", "a v2"), LoadMode::Replace).empty());
    EXPECT_EQ(answer_of(fx, "x"), "a v2");

    const auto errors = fx.state->load_module(module_with_command("b", "x", "from b"), LoadMode::Replace);
    EXPECT_TRUE(has_error(errors, errc::feature_registry_clash));
    EXPECT_EQ(answer_of(fx, "x"), "a v2");
}

TEST(Registry, ForceAlwaysOverwrites)
{
    StateFixture fx;
    ASSERT_TRUE(fx.state->load_module(module_with_command("a", "x", "from a"), LoadMode::Add).empty());

    EXPECT_TRUE(fx.state->load_module(module_with_command("b", "x", "from b"), LoadMode::Force).empty());
    EXPECT_EQ(answer_of(fx, "x"), "from b");
    EXPECT_EQ(fx.state->command("x")->provider->name(), "b");
}

TEST(Registry, FailedOnLoadKeepsWhatWasInserted)
{
    StateFixture fx;
    const auto mod = ModuleBuilder{ "flaky" }
                         .command("kept", "", "", AuthLevel::Public,
                                  [](const HandlerContext&, std::string_view) -> BotCmdResult { return reaction::None{}; })
                         .on_load([](State&) { throw std::runtime_error("database is down"); })
                         .end();

    const auto errors = fx.state->load_module(mod, LoadMode::Add);
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0].kind(), errc::module_load);
    EXPECT_TRUE(fx.state->command("kept").has_value());

    const auto modules = fx.state->module_names();
    EXPECT_NE(std::find(modules.begin(), modules.end(), "flaky"), modules.end());
}

TEST(Registry, OnLoadErrorIsPassedThrough)
{
    StateFixture fx;
    const auto mod = ModuleBuilder{ "strict" }
                         .on_load([](State&) { throw Error(errc::module_load, "missing data file"); })
                         .end();

    const auto errors = fx.state->load_module(mod, LoadMode::Add);
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_NE(std::string{ errors[0].what() }.find("missing data file"), std::string::npos);
}

TEST(Registry, TriggerNamesAreUniqueAcrossPriorities)
{
    StateFixture fx;
    auto fn = [](const HandlerContext&, const std::smatch&) -> BotCmdResult { return reaction::None{}; };

    const auto first = ModuleBuilder{ "a" }.trigger("t", "x", "", TriggerPriority::High, fn).end();
    const auto second = ModuleBuilder{ "b" }.trigger("t", "y", "", TriggerPriority::Low, fn).end();

    ASSERT_TRUE(fx.state->load_module(first, LoadMode::Add).empty());
    EXPECT_TRUE(has_error(fx.state->load_module(second, LoadMode::Add), errc::feature_registry_clash));
    EXPECT_EQ(fx.state->trigger_names(), std::vector<std::string>{ "t" });

    // Force moves the trigger to its new bucket instead of duplicating it.
    EXPECT_TRUE(fx.state->load_module(second, LoadMode::Force).empty());
    const auto buckets = fx.state->triggers_by_priority();
    ASSERT_EQ(buckets.size(), 1U);
    EXPECT_EQ(buckets[0].first, TriggerPriority::Low);
}

TEST(Registry, QueriesListWhatIsLoaded)
{
    StateFixture fx;
    ASSERT_TRUE(fx.state->load_modules({ module_with_command("a", "x", ""), module_with_command("b", "y", "") },
                                       LoadMode::Add)
                    .empty());

    EXPECT_EQ(fx.state->command_names(), (std::vector<std::string>{ "x", "y" }));
    EXPECT_EQ(fx.state->module_names(), (std::vector<std::string>{ "a", "b" }));
    EXPECT_FALSE(fx.state->command("z").has_value());
}

TEST(Authorization, NickAndUserPolicyNeedsBoth)
{
    State state{ make_config({ alice_admin() }, OwnerAuthPolicy::NickAndUser) };

    EXPECT_TRUE(state.have_admin(prefix("alice", "alice", "anywhere")));
    EXPECT_FALSE(state.have_admin(prefix("alice", "mallory", "h")));
    EXPECT_FALSE(state.have_admin(prefix("mallory", "alice", "h")));
}

TEST(Authorization, NickOnlyPolicyIgnoresUser)
{
    State state{ make_config({ alice_admin() }, OwnerAuthPolicy::NickOnly) };

    EXPECT_TRUE(state.have_admin(prefix("alice", "whoever", "h")));
    EXPECT_FALSE(state.have_admin(prefix("mallory", "alice", "h")));
}

TEST(Authorization, UserOnlyPolicyIgnoresNick)
{
    State state{ make_config({ alice_admin() }, OwnerAuthPolicy::UserOnly) };

    EXPECT_TRUE(state.have_admin(prefix("someone", "alice", "h")));
    EXPECT_FALSE(state.have_admin(prefix("alice", "mallory", "h")));
}

TEST(Authorization, HostIsCheckedWhenConfigured)
{
    State state{ make_config({ AdminEntry{ .nick = "alice", .user = "alice", .host = "home.example.org" } }) };

    EXPECT_TRUE(state.have_admin(prefix("alice", "alice", "home.example.org")));
    EXPECT_FALSE(state.have_admin(prefix("alice", "alice", "elsewhere.example.org")));
}

TEST(Authorization, NoAdminsMeansNobody)
{
    State state{ make_config() };
    EXPECT_FALSE(state.have_admin(prefix("alice", "alice", "h")));
}

TEST(Servers, RegisterSeedsPrefixAndNick)
{
    StateFixture fx;
    EXPECT_EQ(fx.state->nick(fx.server_id), kBotNick);
    EXPECT_EQ(fx.state->prefix_len(fx.server_id), std::string{ "ib!ib@" }.size());

    fx.state->update_prefix(fx.server_id, prefix("ib", "~ib", "host.example.org"));
    EXPECT_EQ(fx.state->prefix_len(fx.server_id), std::string{ "ib!~ib@host.example.org" }.size());

    EXPECT_EQ(fx.state->deregister_server(fx.server_id), 0U);
    EXPECT_EQ(fx.state->connection(fx.server_id), nullptr);
}

TEST(Servers, UnknownServerIsAnError)
{
    State state{ make_config() };
    const auto id = make_uuid();

    try
    {
        (void)state.nick(id);
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), errc::unknown_server);
    }
    EXPECT_THROW(state.update_prefix(id, prefix("ib", "ib", "h")), Error);

    // A failed update must not poison the table for everyone else.
    const auto conn = std::make_shared<MockConnection>();
    state.register_server(id, conn);
    EXPECT_EQ(state.connection(id), conn);
}

TEST(Servers, ReplyDestination)
{
    StateFixture fx;
    const auto from = prefix("alice", "alice", "h");

    EXPECT_EQ(fx.state->guess_reply_dest(channel_msg(fx.server_id, from)).target, "#test");
    EXPECT_EQ(fx.state->guess_reply_dest(private_msg(fx.server_id, from)).target, "alice");
    EXPECT_THROW((void)fx.state->guess_reply_dest(private_msg(fx.server_id, irc::MsgPrefix{})), Error);
}

TEST(Registry, PoisonedRegistryIsStillReadWithAWarning)
{
    StateFixture fx;
    ASSERT_TRUE(fx.state->load_module(module_with_command("m", "hello", "hi"), LoadMode::Add).empty());
    ASSERT_TRUE(StateAccess::poison_registry(*fx.state));

    ::testing::internal::CaptureStderr();
    const auto names = fx.state->command_names();
    const auto answer = answer_of(fx, "hello");
    const auto logged = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(names, std::vector<std::string>{ "hello" });
    EXPECT_EQ(answer, "hi");
    EXPECT_NE(logged.find("[registry] warning"), std::string::npos);
}
