// C++ Standard Library
#include <algorithm>
#include <exception>
#include <iostream>

// GSL
#include <gsl/gsl>

// Core
#include <ib/bot/state.hpp>
#include <ib/utils/attributes.hpp>

namespace irc_bot
{

    namespace
    {
        bool may_overwrite(LoadMode mode, const Module& incumbent, const Module& incoming) noexcept
        {
            switch (mode)
            {
            case LoadMode::Add:
                return false;
            case LoadMode::Replace:
                return incumbent.name() == incoming.name();
            case LoadMode::Force:
                return true;
            }
            return false;
        }

        Error feature_clash(std::string_view kind,
                            const std::string& name,
                            const Module& incoming,
                            const Module& incumbent)
        {
            return Error(errc::feature_registry_clash,
                         "the " + std::string{ kind } + " \"" + name + "\" of module \"" + incoming.name() +
                             "\" conflicts with the " + std::string{ kind } + " of the same name provided by module \"" +
                             incumbent.name() + "\"");
        }

        // An admin field left unset matches anything.
        bool cred_matches(const std::optional<std::string>& want, const std::optional<std::string>& have)
        {
            return !want || (have && *have == *want);
        }
    } // namespace

    State::State(Config config, ErrorHandler error_handler) :
        config_{ std::move(config) }, error_handler_{ std::move(error_handler) }, rng_{ std::random_device{}() }
    {
    }

    ErrorReaction State::handle_error(const Error& error) const noexcept
    {
        if (!error_handler_)
        {
            return error_reaction::Proceed{};
        }
        try
        {
            return error_handler_(error);
        }
        catch (const std::exception& e)
        {
            std::cerr << "[bot] error handler threw while handling \"" << error.what() << "\": " << e.what() << '\n';
            return error_reaction::Proceed{};
        }
    }

    std::vector<Error> State::insert_module(Registry& reg, const std::shared_ptr<const Module>& module, LoadMode mode)
    {
        std::vector<Error> errors;

        if (auto it = reg.modules.find(module->name()); it != reg.modules.end() && mode == LoadMode::Add)
        {
            errors.emplace_back(errc::module_registry_clash,
                                "a module named \"" + module->name() + "\" is already loaded");
            return errors;
        }
        reg.modules.insert_or_assign(module->name(), module);

        for (const auto& feature : module->features())
        {
            if (const auto* cmd = std::get_if<CommandFeature>(&feature))
            {
                if (auto it = reg.commands.find(cmd->name); it != reg.commands.end())
                {
                    if (!may_overwrite(mode, *it->second.provider, *module))
                    {
                        errors.push_back(feature_clash("command", cmd->name, *module, *it->second.provider));
                        continue;
                    }
                }

                reg.commands.insert_or_assign(cmd->name,
                                              BotCommand{
                                                  .name = cmd->name,
                                                  .usage = cmd->usage,
                                                  .help = cmd->help,
                                                  .auth_level = cmd->auth_level,
                                                  .handler = cmd->handler,
                                                  .provider = module,
                                              });
                continue;
            }

            const auto& trg = std::get<TriggerFeature>(feature);

            // Trigger names are unique across all priority buckets.
            bool clashed = false;
            for (auto& [priority, bucket] : reg.triggers)
            {
                auto it = std::find_if(bucket.begin(), bucket.end(), [&](const Trigger& t) { return t.name == trg.name; });
                if (it == bucket.end())
                {
                    continue;
                }
                if (!may_overwrite(mode, *it->provider, *module))
                {
                    errors.push_back(feature_clash("trigger", trg.name, *module, *it->provider));
                    clashed = true;
                }
                else
                {
                    bucket.erase(it);
                }
                break;
            }
            if (clashed)
            {
                continue;
            }

            reg.triggers[trg.priority].push_back(Trigger{
                .name = trg.name,
                .pattern = trg.pattern,
                .attrs = trg.attrs,
                .priority = trg.priority,
                .handler = trg.handler,
                .help = trg.help,
                .id = trg.id,
                .provider = module,
            });
        }

        return errors;
    }

    std::vector<Error> State::load_module(std::shared_ptr<const Module> module, LoadMode mode)
    {
        Expects(module != nullptr);

        auto errors = registry_.write([&](Registry& reg) { return insert_module(reg, module, mode); });

        const bool module_rejected = std::any_of(errors.begin(), errors.end(), [](const Error& e) {
            return e.kind() == errc::module_registry_clash;
        });
        if (module_rejected)
        {
            return errors;
        }

        // Callbacks may call back into the registry, so the write lock is not held here.
        for (const auto& callback : module->on_load())
        {
            try
            {
                callback->invoke(*this);
            }
            catch (const Error& e)
            {
                errors.push_back(e);
            }
            catch (const std::exception& e)
            {
                errors.emplace_back(errc::module_load,
                                    "on-load callback of module \"" + module->name() + "\" failed: " + e.what());
            }
        }

        std::cout << "[registry] loaded module \"" << module->name() << "\" with " << errors.size() << " error(s)\n";
        return errors;
    }

    std::vector<Error> State::load_modules(const std::vector<std::shared_ptr<const Module>>& modules, LoadMode mode)
    {
        std::vector<Error> errors;
        for (const auto& m : modules)
        {
            auto errs = load_module(m, mode);
            errors.insert(errors.end(), std::make_move_iterator(errs.begin()), std::make_move_iterator(errs.end()));
        }
        return errors;
    }

    void State::warn_if_registry_poisoned() const
    {
        if (IB_UNLIKELY(registry_.poisoned()))
        {
            std::cerr << "[registry] warning: a writer failed mid-update; reading possibly stale data\n";
        }
    }

    std::optional<BotCommand> State::command(std::string_view name) const
    {
        return read_registry([&](const Registry& reg) -> std::optional<BotCommand> {
            if (auto it = reg.commands.find(name); it != reg.commands.end())
            {
                return it->second;
            }
            return std::nullopt;
        });
    }

    std::vector<std::string> State::command_names() const
    {
        return read_registry([](const Registry& reg) {
            std::vector<std::string> out;
            out.reserve(reg.commands.size());
            for (const auto& [name, cmd] : reg.commands)
            {
                out.push_back(name);
            }
            return out;
        });
    }

    std::vector<std::string> State::module_names() const
    {
        return read_registry([](const Registry& reg) {
            std::vector<std::string> out;
            out.reserve(reg.modules.size());
            for (const auto& [name, module] : reg.modules)
            {
                out.push_back(name);
            }
            return out;
        });
    }

    std::vector<std::string> State::trigger_names() const
    {
        return read_registry([](const Registry& reg) {
            std::vector<std::string> out;
            for (auto it = reg.triggers.rbegin(); it != reg.triggers.rend(); ++it)
            {
                for (const auto& t : it->second)
                {
                    out.push_back(t.name);
                }
            }
            return out;
        });
    }

    std::vector<TriggerBucket> State::triggers_by_priority() const
    {
        return read_registry([](const Registry& reg) {
            std::vector<TriggerBucket> out;
            for (auto it = reg.triggers.rbegin(); it != reg.triggers.rend(); ++it)
            {
                if (!it->second.empty())
                {
                    out.emplace_back(it->first, it->second);
                }
            }
            return out;
        });
    }

    bool State::have_admin(const irc::MsgPrefix& prefix) const
    {
        const auto policy = config_.bot().owner_auth_check_policy;
        const bool check_nick = policy != OwnerAuthPolicy::UserOnly;
        const bool check_user = policy != OwnerAuthPolicy::NickOnly;

        return std::any_of(config_.admins().begin(), config_.admins().end(), [&](const AdminEntry& admin) {
            return (!check_nick || cred_matches(admin.nick, prefix.nick)) &&
                   (!check_user || cred_matches(admin.user, prefix.user)) &&
                   cred_matches(admin.host, prefix.host);
        });
    }

    void State::register_server(ServerId id, std::shared_ptr<irc::Connection> connection)
    {
        Expects(connection != nullptr);

        const auto& bot = config_.bot();
        irc::OwningMsgPrefix initial{ bot.nickname + "!" + bot.username + "@" };

        prefixes_.write([&](auto& m) { m.insert_or_assign(id, std::move(initial)); });
        connections_.write([&](auto& m) { m.insert_or_assign(id, std::move(connection)); });
    }

    std::size_t State::deregister_server(ServerId id)
    {
        prefixes_.write([&](auto& m) { m.erase(id); });
        return connections_.write([&](auto& m) {
            m.erase(id);
            return m.size();
        });
    }

    std::vector<ServerId> State::server_ids() const
    {
        return connections_.read([](const auto& m) {
            std::vector<ServerId> out;
            out.reserve(m.size());
            for (const auto& [id, conn] : m)
            {
                out.push_back(id);
            }
            return out;
        });
    }

    std::shared_ptr<irc::Connection> State::connection(ServerId id) const
    {
        if (connections_.poisoned())
        {
            throw Error(errc::lock_poisoned, "the connection table");
        }
        return connections_.read([&](const auto& m) -> std::shared_ptr<irc::Connection> {
            if (auto it = m.find(id); it != m.end())
            {
                return it->second;
            }
            return nullptr;
        });
    }

    std::string State::nick(ServerId id) const
    {
        auto prefix = prefixes_.read([&](const auto& m) -> std::optional<irc::MsgPrefix> {
            if (auto it = m.find(id); it != m.end())
            {
                return it->second.parse();
            }
            return std::nullopt;
        });
        if (!prefix)
        {
            throw Error(errc::unknown_server, to_string(id));
        }
        if (!prefix->nick || prefix->nick->empty())
        {
            throw Error(errc::nickname_unknown, "own nickname on server " + to_string(id));
        }
        return std::move(*prefix->nick);
    }

    std::size_t State::prefix_len(ServerId id) const
    {
        auto len = prefixes_.read([&](const auto& m) -> std::optional<std::size_t> {
            if (auto it = m.find(id); it != m.end())
            {
                return it->second.len();
            }
            return std::nullopt;
        });
        if (!len)
        {
            throw Error(errc::unknown_server, to_string(id));
        }
        return *len;
    }

    void State::update_prefix(ServerId id, const irc::MsgPrefix& fresh)
    {
        const bool found = prefixes_.write([&](auto& m) {
            auto it = m.find(id);
            if (it == m.end())
            {
                return false;
            }
            it->second.update_from(fresh);
            return true;
        });
        if (!found)
        {
            throw Error(errc::unknown_server, to_string(id));
        }
    }

    MsgDest State::guess_reply_dest(const MsgMetadata& metadata) const
    {
        if (metadata.dest.target != nick(metadata.dest.server_id))
        {
            return metadata.dest;
        }
        if (!metadata.prefix.nick || metadata.prefix.nick->empty())
        {
            throw Error(errc::nickname_unknown, "sender of a private message");
        }
        return MsgDest{ .server_id = metadata.dest.server_id, .target = *metadata.prefix.nick };
    }

    std::string_view State::framework_name() noexcept
    {
        return IB_PROJECT_NAME;
    }

    std::string_view State::framework_version() noexcept
    {
        return IB_PROJECT_VERSION;
    }

    std::string_view State::framework_homepage() noexcept
    {
        return IB_PROJECT_HOMEPAGE;
    }

} // namespace irc_bot
