/*
Module: main.cpp

Purpose:
- Entry point: load configuration, build the bot, load the built-in modules and run.

Notes:
- Config is read from the path given as the first argument, else ./config.toml.
  Fails fast with ConfigError.
- A module load error is passed to the error handler; the default handler logs and the
  bot starts with whatever did load.
- bot.run() blocks until every server has quit or dropped.
*/

// C++ Standard Library
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

// Core
#include <ib/bot/bot.hpp>
#include <ib/bot/config.hpp>

// App
#include <app/default_module.hpp>
#include <app/test_module.hpp>

int main(int argc, char** argv)
{
    try
    {
        // 1) Load immutable configuration (identity, admins, servers).
        const std::filesystem::path config_path = argc > 1 ? argv[1] : "config.toml";
        auto cfg = irc_bot::Config::load_file(config_path);

        // 2) Construct the bot; pools are sized from [bot].
        irc_bot::Bot bot{ std::move(cfg) };

        std::cout << "[bot] " << irc_bot::State::framework_name() << " v" << irc_bot::State::framework_version()
                  << '\n';
        std::cout << "[bot] modules look for operator-provided data in: " << bot.state().module_data_path() << '\n';

        // 3) Built-in modules.
        if (!bot.load_modules({ app::default_module(), app::test_module() }, irc_bot::LoadMode::Add))
        {
            std::cerr << "Module loading aborted by the error handler\n";
            return EXIT_FAILURE;
        }

        // 4) Hand control to the bot: blocks until no server remains.
        bot.run();
    }
    catch (const irc_bot::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal startup error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
