/*
Module Name:
- handler.hpp

Abstract:
- Interfaces that module code implements: command handlers, trigger handlers and
  on-load callbacks. Plain callables are adapted by the make_*_handler helpers.
- Handlers are shared between the Module that declared them and the registry entries
  that point at them, and may run on several worker threads at once; invoke() is const.
*/
#pragma once

// C++ Standard Library
#include <memory>
#include <regex>
#include <string_view>
#include <type_traits>
#include <utility>

// Core
#include <ib/bot/msg_metadata.hpp>
#include <ib/bot/reaction.hpp>

namespace irc_bot
{

    class State;

    // Everything a handler may look at while it runs.
    struct HandlerContext
    {
        const State& state;
        const MsgMetadata& metadata;
        // Name of the command or trigger being run.
        std::string_view feature_name;
    };

    class BotCmdHandler
    {
    public:
        virtual ~BotCmdHandler() = default;

        // arg is the command line after the command name, trimmed.
        [[nodiscard]] virtual BotCmdResult invoke(const HandlerContext& ctx, std::string_view arg) const = 0;
    };

    class TriggerHandler
    {
    public:
        virtual ~TriggerHandler() = default;

        [[nodiscard]] virtual BotCmdResult invoke(const HandlerContext& ctx, const std::smatch& captures) const = 0;
    };

    class ModuleLoadHandler
    {
    public:
        virtual ~ModuleLoadHandler() = default;

        // Throw (preferably irc_bot::Error) to report failure.
        virtual void invoke(State& state) const = 0;
    };

    namespace detail
    {
        template<typename F>
        class FnBotCmdHandler final : public BotCmdHandler
        {
        public:
            explicit FnBotCmdHandler(F fn) :
                fn_{ std::move(fn) }
            {
            }

            BotCmdResult invoke(const HandlerContext& ctx, std::string_view arg) const override
            {
                return fn_(ctx, arg);
            }

        private:
            F fn_;
        };

        template<typename F>
        class FnTriggerHandler final : public TriggerHandler
        {
        public:
            explicit FnTriggerHandler(F fn) :
                fn_{ std::move(fn) }
            {
            }

            BotCmdResult invoke(const HandlerContext& ctx, const std::smatch& captures) const override
            {
                return fn_(ctx, captures);
            }

        private:
            F fn_;
        };

        template<typename F>
        class FnModuleLoadHandler final : public ModuleLoadHandler
        {
        public:
            explicit FnModuleLoadHandler(F fn) :
                fn_{ std::move(fn) }
            {
            }

            void invoke(State& state) const override
            {
                fn_(state);
            }

        private:
            F fn_;
        };
    } // namespace detail

    template<typename F>
    [[nodiscard]] std::shared_ptr<const BotCmdHandler> make_bot_cmd_handler(F&& fn)
    {
        static_assert(std::is_invocable_v<const std::decay_t<F>&, const HandlerContext&, std::string_view>,
                      "command handler must be callable as (const HandlerContext&, std::string_view)");
        return std::make_shared<detail::FnBotCmdHandler<std::decay_t<F>>>(std::forward<F>(fn));
    }

    template<typename F>
    [[nodiscard]] std::shared_ptr<const TriggerHandler> make_trigger_handler(F&& fn)
    {
        static_assert(std::is_invocable_v<const std::decay_t<F>&, const HandlerContext&, const std::smatch&>,
                      "trigger handler must be callable as (const HandlerContext&, const std::smatch&)");
        return std::make_shared<detail::FnTriggerHandler<std::decay_t<F>>>(std::forward<F>(fn));
    }

    template<typename F>
    [[nodiscard]] std::shared_ptr<const ModuleLoadHandler> make_module_load_handler(F&& fn)
    {
        static_assert(std::is_invocable_v<const std::decay_t<F>&, State&>,
                      "on-load callback must be callable as (State&)");
        return std::make_shared<detail::FnModuleLoadHandler<std::decay_t<F>>>(std::forward<F>(fn));
    }

} // namespace irc_bot
