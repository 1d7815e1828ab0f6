// C++ Standard Library
#include <limits>
#include <string>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Core
#include <ib/bot/config.hpp>

namespace irc_bot
{

    namespace
    {
        // Return a non-empty string at key in table or throw ConfigError.
        std::string fetch_string(const toml::table& tbl, std::string_view key, const std::string& where)
        {
            const auto* node = tbl.get(key);
            if (!node)
                throw ConfigError("Missing key '" + std::string{ key } + "' in " + where);

            if (auto opt = node->value<std::string>(); opt && !opt->empty())
                return *opt;

            throw ConfigError("Invalid value for '" + std::string{ key } + "' in " + where);
        }

        // Return the string at key if present and non-empty.
        std::optional<std::string> fetch_optional_string(const toml::table& tbl, std::string_view key)
        {
            if (auto opt = tbl[key].value<std::string>(); opt && !opt->empty())
                return opt;
            return std::nullopt;
        }

        // Integer at key within [lo, hi], or fallback if the key is absent.
        std::int64_t fetch_integer(const toml::table& tbl,
                                   std::string_view key,
                                   std::int64_t fallback,
                                   std::int64_t lo,
                                   std::int64_t hi,
                                   const std::string& where)
        {
            const auto* node = tbl.get(key);
            if (!node)
                return fallback;

            auto opt = node->value<std::int64_t>();
            if (!opt || *opt < lo || *opt > hi)
                throw ConfigError("Invalid value for '" + std::string{ key } + "' in " + where);
            return *opt;
        }

        BotConfig read_bot(const toml::table& root, const std::string& source)
        {
            const auto* bot = root.get_as<toml::table>("bot");
            if (!bot)
                throw ConfigError("Missing table [bot] in " + source);

            const std::string where = "[bot] of " + source;

            BotConfig cfg;
            cfg.nickname = fetch_string(*bot, "nickname", where);
            cfg.username = fetch_optional_string(*bot, "username").value_or(cfg.nickname);
            cfg.realname = fetch_optional_string(*bot, "realname").value_or(cfg.nickname);

            // An empty suffix is legal, so this one is not fetched as non-empty.
            if (auto suffix = (*bot)["addressee_suffix"].value<std::string>())
                cfg.addressee_suffix = std::move(*suffix);

            if (auto policy = fetch_optional_string(*bot, "owner_auth_check_policy"))
                cfg.owner_auth_check_policy = parse_owner_auth_policy(*policy);

            cfg.outbox_capacity = static_cast<std::size_t>(
                fetch_integer(*bot, "outbox_capacity", 256, 1, std::numeric_limits<std::int32_t>::max(), where));
            cfg.worker_threads = static_cast<unsigned>(fetch_integer(*bot, "worker_threads", 4, 1, 256, where));
            cfg.prefix_refresh = std::chrono::minutes{
                fetch_integer(*bot, "prefix_refresh_minutes", 10, 1, 24 * 60, where)
            };
            cfg.module_data_path = fetch_optional_string(*bot, "module_data_path").value_or("");
            return cfg;
        }

        std::vector<AdminEntry> read_admins(const toml::table& root, const std::string& source)
        {
            std::vector<AdminEntry> out;
            const auto* arr = root.get_as<toml::array>("admins");
            if (!arr)
                return out;

            for (const auto& node : *arr)
            {
                const auto* t = node.as_table();
                if (!t)
                    throw ConfigError("Each [[admins]] entry must be a table in " + source);

                out.push_back(AdminEntry{
                    .nick = fetch_optional_string(*t, "nick"),
                    .user = fetch_optional_string(*t, "user"),
                    .host = fetch_optional_string(*t, "host"),
                });
            }
            return out;
        }

        std::vector<ServerConfig> read_servers(const toml::table& root, const std::string& source)
        {
            std::vector<ServerConfig> out;
            const auto* arr = root.get_as<toml::array>("servers");
            if (!arr)
                return out;

            const std::string where = "[[servers]] of " + source;
            for (const auto& node : *arr)
            {
                const auto* t = node.as_table();
                if (!t)
                    throw ConfigError("Each [[servers]] entry must be a table in " + source);

                ServerConfig srv;
                srv.host = fetch_string(*t, "host", where);
                srv.port = static_cast<std::uint16_t>(fetch_integer(*t, "port", 6667, 1, 65535, where));

                if (const auto* chans = t->get_as<toml::array>("channels"))
                {
                    for (const auto& ch : *chans)
                    {
                        auto name = ch.value<std::string>();
                        if (!name || name->empty())
                            throw ConfigError("Invalid channel name in " + where);
                        srv.channels.push_back(std::move(*name));
                    }
                }
                out.push_back(std::move(srv));
            }
            return out;
        }

        Config from_table(const toml::table& root, const std::string& source)
        {
            return Config(read_bot(root, source), read_admins(root, source), read_servers(root, source));
        }
    } // namespace

    ConfigError::ConfigError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

    OwnerAuthPolicy parse_owner_auth_policy(std::string_view text)
    {
        if (text == "nick+user")
            return OwnerAuthPolicy::NickAndUser;
        if (text == "nick-only")
            return OwnerAuthPolicy::NickOnly;
        if (text == "user-only")
            return OwnerAuthPolicy::UserOnly;
        throw ConfigError("owner_auth_check_policy '" + std::string{ text } +
                          "' is not `nick+user`, `nick-only`, or `user-only`");
    }

    Config::Config(BotConfig bot_cfg, std::vector<AdminEntry> admins, std::vector<ServerConfig> servers) :
        bot_{ std::move(bot_cfg) }, admins_{ std::move(admins) }, servers_{ std::move(servers) }
    {
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        const auto path_str = path.string();
        if (path_str.empty())
            throw ConfigError("Config file path must not be empty");

        toml::table tbl;
        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw ConfigError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }
        return from_table(tbl, path_str);
    }

    Config Config::parse(std::string_view toml_text, std::string_view source)
    {
        const std::string source_str{ source };
        toml::table tbl;
        try
        {
            tbl = toml::parse(toml_text, source);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + source_str + "': " + std::string{ e.what() });
        }
        return from_table(tbl, source_str);
    }

} // namespace irc_bot
