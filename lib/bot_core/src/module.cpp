// C++ Standard Library
#include <algorithm>
#include <cctype>

// GSL
#include <gsl/gsl>

// Core
#include <ib/bot/error.hpp>
#include <ib/bot/module.hpp>

namespace irc_bot
{

    std::string_view to_string(AuthLevel level) noexcept
    {
        switch (level)
        {
        case AuthLevel::Public:
            return "Public";
        case AuthLevel::Admin:
            return "Admin";
        }
        return "?";
    }

    std::string_view to_string(TriggerPriority priority) noexcept
    {
        switch (priority)
        {
        case TriggerPriority::Minimum:
            return "Minimum";
        case TriggerPriority::Low:
            return "Low";
        case TriggerPriority::Medium:
            return "Medium";
        case TriggerPriority::High:
            return "High";
        case TriggerPriority::Maximum:
            return "Maximum";
        }
        return "?";
    }

    const std::string& feature_name(const ModuleFeature& feature) noexcept
    {
        return std::visit([](const auto& f) -> const std::string& { return f.name; }, feature);
    }

    std::string_view feature_kind(const ModuleFeature& feature) noexcept
    {
        return std::holds_alternative<CommandFeature>(feature) ? "command" : "trigger";
    }

    ModuleBuilder::ModuleBuilder(std::string name) :
        module_{ new Module() }
    {
        module_->name_ = std::move(name);
        module_->id_ = make_uuid();
    }

    ModuleBuilder& ModuleBuilder::command(std::string name,
                                          std::string usage,
                                          std::string help,
                                          AuthLevel auth_level,
                                          std::shared_ptr<const BotCmdHandler> handler)
    {
        Expects(module_ != nullptr);
        Expects(handler != nullptr);

        const bool has_space = std::any_of(name.begin(), name.end(), [](unsigned char c) { return std::isspace(c) != 0; });
        if (name.empty() || has_space)
        {
            throw Error(errc::invalid_feature_name,
                        "module \"" + module_->name_ + "\" tried to register a command named \"" + name +
                            "\", but command names may not be empty or contain whitespace");
        }

        module_->features_.emplace_back(CommandFeature{
            .name = std::move(name),
            .usage = std::move(usage),
            .help = std::move(help),
            .auth_level = auth_level,
            .handler = std::move(handler),
        });
        return *this;
    }

    ModuleBuilder& ModuleBuilder::trigger(std::string name,
                                          std::string_view pattern,
                                          std::string help,
                                          TriggerPriority priority,
                                          std::shared_ptr<const TriggerHandler> handler,
                                          std::vector<TriggerAttr> attrs)
    {
        Expects(module_ != nullptr);
        Expects(handler != nullptr);

        std::regex re;
        try
        {
            re = std::regex(pattern.begin(), pattern.end(), std::regex::ECMAScript);
        }
        catch (const std::regex_error& e)
        {
            throw Error(errc::invalid_trigger_pattern,
                        "trigger \"" + name + "\" of module \"" + module_->name_ + "\": " + e.what());
        }

        module_->features_.emplace_back(TriggerFeature{
            .name = std::move(name),
            .pattern = std::make_shared<Guarded<std::regex>>(std::move(re)),
            .attrs = std::move(attrs),
            .priority = priority,
            .handler = std::move(handler),
            .help = std::move(help),
            .id = make_uuid(),
        });
        return *this;
    }

    ModuleBuilder& ModuleBuilder::on_load(std::shared_ptr<const ModuleLoadHandler> handler)
    {
        Expects(module_ != nullptr);
        Expects(handler != nullptr);

        module_->on_load_.push_back(std::move(handler));
        return *this;
    }

    std::shared_ptr<const Module> ModuleBuilder::end()
    {
        Expects(module_ != nullptr);
        return std::shared_ptr<const Module>(module_.release());
    }

} // namespace irc_bot
