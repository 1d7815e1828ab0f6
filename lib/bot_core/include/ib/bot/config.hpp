/*
Module Name:
- config.hpp

Abstract:
- Immutable bot configuration loaded from a single TOML file.
- Surfaces strongly typed sections (bot identity and tuning, admins, servers).
- Fails fast with ConfigError on invalid or missing configuration.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace irc_bot
{

    /// Configuration-loading failure.
    class ConfigError final : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& msg) noexcept;
    };

    /// Which parts of a sender's prefix must match an admin entry.
    enum class OwnerAuthPolicy
    {
        NickAndUser,
        NickOnly,
        UserOnly,
    };

    /// Parse "nick+user", "nick-only" or "user-only". Throws ConfigError otherwise.
    [[nodiscard]] OwnerAuthPolicy parse_owner_auth_policy(std::string_view text);

    /// One configured administrator. An absent field matches anything.
    struct AdminEntry
    {
        std::optional<std::string> nick;
        std::optional<std::string> user;
        std::optional<std::string> host;
    };

    struct ServerConfig
    {
        std::string host;
        std::uint16_t port = 6667;
        std::vector<std::string> channels;
    };

    /// Bot identity and tuning knobs.
    /// username and realname default to nickname if not set in the file.
    struct BotConfig
    {
        std::string nickname;
        std::string username;
        std::string realname;
        std::string addressee_suffix = ": ";
        OwnerAuthPolicy owner_auth_check_policy = OwnerAuthPolicy::NickAndUser;
        std::size_t outbox_capacity = 256;
        unsigned worker_threads = 4;
        std::chrono::minutes prefix_refresh{ 10 };
        std::string module_data_path;
    };

    class Config
    {
    public:
        Config(BotConfig bot_cfg, std::vector<AdminEntry> admins, std::vector<ServerConfig> servers);

        /// Load from the file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        /// Parse TOML text; source names the input in error messages.
        static Config parse(std::string_view toml_text, std::string_view source = "<string>");

        [[nodiscard]] const BotConfig& bot() const noexcept
        {
            return bot_;
        }
        [[nodiscard]] const std::vector<AdminEntry>& admins() const noexcept
        {
            return admins_;
        }
        [[nodiscard]] const std::vector<ServerConfig>& servers() const noexcept
        {
            return servers_;
        }

    private:
        BotConfig bot_;
        std::vector<AdminEntry> admins_;
        std::vector<ServerConfig> servers_;
    };

} // namespace irc_bot
