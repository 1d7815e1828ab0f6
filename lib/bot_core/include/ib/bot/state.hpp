/*
Module Name:
- state.hpp

Abstract:
- The bot's shared state: the module/feature registry, per-server prefix cache and
  connection table, configuration, the shared RNG and the operator's error handler.
- One State is shared by std::shared_ptr between the harness, every worker and the
  outbox drain worker. Every member is either immutable after construction or guarded.

Notes:
- Registry lookups return copies so that a reload cannot invalidate an in-flight worker.
- A poisoned registry is still read (with a warning); a poisoned connection table is not.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Core
#include <ib/bot/config.hpp>
#include <ib/bot/error.hpp>
#include <ib/bot/ids.hpp>
#include <ib/bot/module.hpp>
#include <ib/bot/msg_metadata.hpp>
#include <ib/bot/reaction.hpp>
#include <ib/irc/connection.hpp>
#include <ib/irc/msg_prefix.hpp>
#include <ib/utils/guarded.hpp>
#include <ib/utils/transparent_string_less.hpp>

namespace irc_bot
{

    // Registry entry for a command.
    struct BotCommand
    {
        std::string name;
        std::string usage;
        std::string help;
        AuthLevel auth_level = AuthLevel::Public;
        std::shared_ptr<const BotCmdHandler> handler;
        std::shared_ptr<const Module> provider;
    };

    // Registry entry for a trigger.
    struct Trigger
    {
        std::string name;
        TriggerPattern pattern;
        std::vector<TriggerAttr> attrs;
        TriggerPriority priority = TriggerPriority::Medium;
        std::shared_ptr<const TriggerHandler> handler;
        std::string help;
        boost::uuids::uuid id{};
        std::shared_ptr<const Module> provider;
    };

    // Triggers of one priority, in registration order.
    using TriggerBucket = std::pair<TriggerPriority, std::vector<Trigger>>;

    namespace test
    {
        struct StateAccess;
    }

    class State
    {
    public:
        explicit State(Config config, ErrorHandler error_handler = default_error_handler());

        State(const State&) = delete;
        State& operator=(const State&) = delete;

        [[nodiscard]] const Config& config() const noexcept
        {
            return config_;
        }

        [[nodiscard]] std::string_view addressee_suffix() const noexcept
        {
            return config_.bot().addressee_suffix;
        }

        // Where modules look for operator-provided data. Empty when not configured.
        [[nodiscard]] std::filesystem::path module_data_path() const
        {
            return config_.bot().module_data_path;
        }

        // Call the operator's error handler. A throwing handler is logged and treated as Proceed.
        [[nodiscard]] ErrorReaction handle_error(const Error& error) const noexcept;

        // --- Registry ---

        // Insert module and its features under mode, then run its on-load callbacks.
        // Returns every clash and on-load failure; features inserted before a failure stay.
        std::vector<Error> load_module(std::shared_ptr<const Module> module, LoadMode mode);

        // load_module for each, accumulating errors.
        std::vector<Error> load_modules(const std::vector<std::shared_ptr<const Module>>& modules, LoadMode mode);

        [[nodiscard]] std::optional<BotCommand> command(std::string_view name) const;
        [[nodiscard]] std::vector<std::string> command_names() const;
        [[nodiscard]] std::vector<std::string> module_names() const;
        [[nodiscard]] std::vector<std::string> trigger_names() const;

        // Snapshot of the trigger buckets, highest priority first. Empty buckets omitted.
        [[nodiscard]] std::vector<TriggerBucket> triggers_by_priority() const;

        // --- Authorization ---

        // True when prefix matches a configured admin under the owner-auth policy.
        [[nodiscard]] bool have_admin(const irc::MsgPrefix& prefix) const;

        // --- Servers ---

        // Record the connection and seed the prefix cache with "nick!user@".
        void register_server(ServerId id, std::shared_ptr<irc::Connection> connection);

        // Returns the number of servers still registered.
        std::size_t deregister_server(ServerId id);

        [[nodiscard]] std::vector<ServerId> server_ids() const;

        // Throws Error(lock_poisoned) if the connection table is poisoned.
        // Returns nullptr for an unknown id.
        [[nodiscard]] std::shared_ptr<irc::Connection> connection(ServerId id) const;

        // The bot's current nickname on a server. Throws Error(unknown_server).
        [[nodiscard]] std::string nick(ServerId id) const;

        // Length of the bot's own prefix as last seen. Throws Error(unknown_server).
        [[nodiscard]] std::size_t prefix_len(ServerId id) const;

        // Merge a freshly observed own prefix into the cache. Throws Error(unknown_server).
        void update_prefix(ServerId id, const irc::MsgPrefix& fresh);

        // Private messages are answered to the sender; channel messages in the channel.
        // Throws Error(nickname_unknown) for a private message with no sender nick.
        [[nodiscard]] MsgDest guess_reply_dest(const MsgMetadata& metadata) const;

        // Run fn(std::mt19937&) with the RNG lock held.
        template<typename F>
        auto with_rng(F&& fn) const -> decltype(std::forward<F>(fn)(std::declval<std::mt19937&>()))
        {
            std::lock_guard lk(rng_mutex_);
            return std::forward<F>(fn)(rng_);
        }

        [[nodiscard]] static std::string_view framework_name() noexcept;
        [[nodiscard]] static std::string_view framework_version() noexcept;
        [[nodiscard]] static std::string_view framework_homepage() noexcept;

    private:
        friend struct test::StateAccess;

        struct Registry
        {
            std::map<std::string, BotCommand, TransparentStringLess> commands;
            std::map<TriggerPriority, std::vector<Trigger>> triggers;
            std::map<std::string, std::shared_ptr<const Module>, TransparentStringLess> modules;
        };

        template<typename F>
        auto read_registry(F&& fn) const
        {
            warn_if_registry_poisoned();
            return registry_.read(std::forward<F>(fn));
        }

        void warn_if_registry_poisoned() const;

        // Under the registry write lock. Returns the clashes found.
        static std::vector<Error> insert_module(Registry& reg, const std::shared_ptr<const Module>& module, LoadMode mode);

        Config config_;
        ErrorHandler error_handler_;

        Guarded<Registry> registry_;
        Guarded<std::map<ServerId, irc::OwningMsgPrefix>> prefixes_;
        Guarded<std::map<ServerId, std::shared_ptr<irc::Connection>>> connections_;

        mutable std::mutex rng_mutex_;
        mutable std::mt19937 rng_;
    };

} // namespace irc_bot
