/**
 * pkgverify - a package dependency verifier.
 *
 * Program entry point.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <print>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "commandline/commandline.h"
#include "environment.h"
#include "verifier.h"

namespace cl = pkgverify::commandline;

/** Commands by name. */
using command_table = std::map<std::string, std::unique_ptr<cl::command>>;

/** Register a command under its own name. */
template<typename T>
static void register_command(command_table& table, const std::string& program_name, const pkgverify::environment& env)
{
    auto cmd = std::make_unique<T>(program_name, env);
    std::string name = cmd->get_name();
    table.emplace(std::move(name), std::move(cmd));
}

/** Print the usage and the available commands. */
static void print_usage(const std::string& program_name, const command_table& table)
{
    std::println("Usage: {} <command> [options]\n", program_name);
    std::println("Verifies that the dependencies of an installed package are present and satisfy their version ranges.\n");
    std::println("Commands:");
    for(const auto& [name, cmd]: table)
    {
        std::println("  {:<10}{}", name, cmd->get_description());
    }
    std::println("\nRun '{} <command> --help' for the command's options.", program_name);
}

int main(int argc, char* argv[])
{
    const std::string program_name = argc > 0 ? argv[0] : pkgverify::tool_name;

    try
    {
        // snapshot the environment once for all commands.
        const pkgverify::environment env = pkgverify::environment::from_process(argc > 0 ? argv[0] : std::string{});

        command_table table;
        register_command<cl::verify>(table, program_name, env);
        register_command<cl::resolve>(table, program_name, env);
        register_command<cl::paths>(table, program_name, env);

        if(argc < 2)
        {
            print_usage(program_name, table);
            return EXIT_SUCCESS;
        }

        const std::string command_name = argv[1];    // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        auto it = table.find(command_name);
        if(it == table.end())
        {
            print_usage(program_name, table);
            std::println(stderr, "\n{}: Unknown command '{}'.", pkgverify::tool_name, command_name);
            return EXIT_FAILURE;
        }

        it->second->invoke({argv + 2, argv + argc});    // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return EXIT_SUCCESS;
    }
    catch(const pkgverify::verify_error& e)
    {
        std::println(stderr, "{}: {} ({}): {}", pkgverify::tool_name, e.get_code(), pkgverify::to_string(e.get_kind()), e.what());
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        std::println(stderr, "{}: {}", pkgverify::tool_name, e.what());
    }
    catch(const std::exception& e)
    {
        std::println(stderr, "{}: {}", pkgverify::tool_name, e.what());
    }

    return EXIT_FAILURE;
}
