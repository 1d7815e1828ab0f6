// C++ Standard Library
#include <random>
#include <regex>
#include <utility>
#include <vector>

// Core
#include <ib/bot/state.hpp>
#include <ib/bot/trigger.hpp>

#include "invoke_guarded.hpp"

namespace irc_bot
{

    std::optional<TriggerOutcome> run_any_matching(const State& state,
                                                   std::string_view text,
                                                   const MsgMetadata& metadata)
    {
        // smatch holds iterators into this string; it must outlive every match below.
        const std::string subject{ text };

        for (const auto& entry : state.triggers_by_priority())
        {
            std::vector<std::pair<const Trigger*, std::smatch>> matches;
            for (const auto& trg : entry.second)
            {
                std::smatch m;
                const bool hit = trg.pattern->read(
                    [&](const std::regex& re) { return std::regex_search(subject, m, re); });
                if (hit)
                {
                    matches.emplace_back(&trg, std::move(m));
                }
            }

            if (matches.empty())
            {
                continue;
            }

            const auto pick = state.with_rng([&](std::mt19937& rng) {
                return std::uniform_int_distribution<std::size_t>{ 0, matches.size() - 1 }(rng);
            });
            const Trigger* trg = matches[pick].first;
            const std::smatch& captures = matches[pick].second;

            const HandlerContext ctx{ .state = state, .metadata = metadata, .feature_name = trg->name };
            auto res = detail::invoke_guarded("trigger", trg->name, [&] { return trg->handler->invoke(ctx, captures); });
            return TriggerOutcome{ .trigger_name = trg->name, .result = std::move(res) };
        }

        return std::nullopt;
    }

} // namespace irc_bot
