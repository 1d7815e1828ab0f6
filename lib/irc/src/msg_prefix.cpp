// C++ Standard Library
#include <string>

// Core
#include <ib/irc/msg_prefix.hpp>

namespace irc_bot::irc
{

    namespace
    {
        std::size_t component_len(const std::optional<std::string>& c) noexcept
        {
            return c ? c->size() : 0;
        }
    } // namespace

    std::size_t MsgPrefix::len() const noexcept
    {
        return component_len(nick) + component_len(user) + component_len(host) + 2;
    }

    std::string MsgPrefix::to_string() const
    {
        std::string out;
        out.reserve(len());
        out.append(nick.value_or(""));

        const std::string_view u = user ? std::string_view{ *user } : std::string_view{};
        const std::string_view h = host ? std::string_view{ *host } : std::string_view{};

        if (!u.empty())
        {
            out.push_back('!');
            out.append(u);
            out.push_back('@');
            // RFC 2812 has no user-without-host form; keep the shape parseable.
            out.append(h.empty() ? std::string_view{ "prefix-has-user-without-host.invalid" } : h);
        }
        else if (!h.empty())
        {
            out.push_back('@');
            out.append(h);
        }
        return out;
    }

    MsgPrefix parse_prefix(std::string_view prefix)
    {
        MsgPrefix out;
        if (prefix.empty())
        {
            return out;
        }

        if (const auto at = prefix.rfind('@'); at != std::string_view::npos)
        {
            out.host = std::string{ prefix.substr(at + 1) };
            prefix = prefix.substr(0, at);
        }

        if (const auto bang = prefix.find('!'); bang != std::string_view::npos)
        {
            out.user = std::string{ prefix.substr(bang + 1) };
            prefix = prefix.substr(0, bang);
        }

        out.nick = std::string{ prefix };
        return out;
    }

    void OwningMsgPrefix::update_from(const MsgPrefix& fresh)
    {
        const MsgPrefix old = parse();

        auto pick = [](const std::optional<std::string>& o, const std::optional<std::string>& n) -> std::string {
            if (n)
            {
                return *n;
            }
            return o.value_or("");
        };

        backing_ = pick(old.nick, fresh.nick) + "!" + pick(old.user, fresh.user) + "@" + pick(old.host, fresh.host);
    }

} // namespace irc_bot::irc
