/*
Module Name:
- module.hpp

Abstract:
- A Module is a named bundle of commands, triggers and on-load callbacks, built with
  ModuleBuilder and handed to State::load_module.
- Modules are immutable once built and shared: the registry keeps them alive for as long
  as any command or trigger entry still points at them.
*/
#pragma once

// C++ Standard Library
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Core
#include <ib/bot/handler.hpp>
#include <ib/bot/ids.hpp>
#include <ib/utils/guarded.hpp>

namespace irc_bot
{

    enum class AuthLevel
    {
        Public,
        Admin,
    };

    // Buckets are scanned from Maximum down to Minimum.
    enum class TriggerPriority
    {
        Minimum,
        Low,
        Medium,
        High,
        Maximum,
    };

    // Reserved. Carried through registration, no behaviour yet.
    enum class TriggerAttr
    {
        AlwaysWatching,
    };

    enum class LoadMode
    {
        // Fail on any name already present.
        Add,
        // Overwrite entries provided by a module of the same name.
        Replace,
        // Overwrite unconditionally.
        Force,
    };

    [[nodiscard]] std::string_view to_string(AuthLevel level) noexcept;
    [[nodiscard]] std::string_view to_string(TriggerPriority priority) noexcept;

    // Shared so that a pattern can be swapped while the trigger stays registered.
    using TriggerPattern = std::shared_ptr<Guarded<std::regex>>;

    struct CommandFeature
    {
        std::string name;
        std::string usage;
        std::string help;
        AuthLevel auth_level = AuthLevel::Public;
        std::shared_ptr<const BotCmdHandler> handler;
    };

    struct TriggerFeature
    {
        std::string name;
        TriggerPattern pattern;
        std::vector<TriggerAttr> attrs;
        TriggerPriority priority = TriggerPriority::Medium;
        std::shared_ptr<const TriggerHandler> handler;
        std::string help;
        boost::uuids::uuid id{};
    };

    using ModuleFeature = std::variant<CommandFeature, TriggerFeature>;

    [[nodiscard]] const std::string& feature_name(const ModuleFeature& feature) noexcept;

    // "command" or "trigger", for messages.
    [[nodiscard]] std::string_view feature_kind(const ModuleFeature& feature) noexcept;

    class Module
    {
    public:
        [[nodiscard]] const std::string& name() const noexcept
        {
            return name_;
        }
        [[nodiscard]] const ModuleId& id() const noexcept
        {
            return id_;
        }
        [[nodiscard]] const std::vector<ModuleFeature>& features() const noexcept
        {
            return features_;
        }
        [[nodiscard]] const std::vector<std::shared_ptr<const ModuleLoadHandler>>& on_load() const noexcept
        {
            return on_load_;
        }

    private:
        friend class ModuleBuilder;

        Module() = default;

        std::string name_;
        ModuleId id_{};
        std::vector<ModuleFeature> features_;
        std::vector<std::shared_ptr<const ModuleLoadHandler>> on_load_;
    };

    class ModuleBuilder
    {
    public:
        explicit ModuleBuilder(std::string name);

        // Throws Error(invalid_feature_name) if name is empty or contains whitespace.
        ModuleBuilder& command(std::string name,
                               std::string usage,
                               std::string help,
                               AuthLevel auth_level,
                               std::shared_ptr<const BotCmdHandler> handler);

        template<typename F>
            requires(!std::is_convertible_v<F, std::shared_ptr<const BotCmdHandler>>)
        ModuleBuilder& command(std::string name, std::string usage, std::string help, AuthLevel auth_level, F&& fn)
        {
            return command(std::move(name),
                           std::move(usage),
                           std::move(help),
                           auth_level,
                           make_bot_cmd_handler(std::forward<F>(fn)));
        }

        // Throws Error(invalid_trigger_pattern) if pattern is not a valid ECMAScript regex.
        ModuleBuilder& trigger(std::string name,
                               std::string_view pattern,
                               std::string help,
                               TriggerPriority priority,
                               std::shared_ptr<const TriggerHandler> handler,
                               std::vector<TriggerAttr> attrs = {});

        template<typename F>
            requires(!std::is_convertible_v<F, std::shared_ptr<const TriggerHandler>>)
        ModuleBuilder& trigger(std::string name,
                               std::string_view pattern,
                               std::string help,
                               TriggerPriority priority,
                               F&& fn,
                               std::vector<TriggerAttr> attrs = {})
        {
            return trigger(std::move(name),
                           pattern,
                           std::move(help),
                           priority,
                           make_trigger_handler(std::forward<F>(fn)),
                           std::move(attrs));
        }

        ModuleBuilder& on_load(std::shared_ptr<const ModuleLoadHandler> handler);

        template<typename F>
            requires(!std::is_convertible_v<F, std::shared_ptr<const ModuleLoadHandler>>)
        ModuleBuilder& on_load(F&& fn)
        {
            return on_load(make_module_load_handler(std::forward<F>(fn)));
        }

        // Finish. The builder is left empty.
        [[nodiscard]] std::shared_ptr<const Module> end();

    private:
        std::unique_ptr<Module> module_;
    };

} // namespace irc_bot
