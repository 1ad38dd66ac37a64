/**
 * pkgverify - a package dependency verifier.
 *
 * commands to be executed from the command line.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <format>
#include <ranges>
#include <utility>

#include "commandline.h"
#include "search_strategy.h"

namespace pkgverify::commandline
{

command::command(std::string name, std::string program_name, const pkgverify::environment& env)
: name{std::move(name)}
, program_name{std::move(program_name)}
, env{env}
{
}

cxxopts::Options command::make_cxxopts_options() const
{
    cxxopts::Options options{std::format("{} {}", program_name, name), get_description()};
    options.add_options()("h,help", "Print help.");
    return options;
}

void command::add_directory_option(cxxopts::Options& options, const std::string& description)
{
    options.add_options()("d,directory", description, cxxopts::value<std::string>()->default_value("."));
}

fs::path command::get_directory(const cxxopts::ParseResult& result)
{
    return result["directory"].as<std::string>();
}

cxxopts::ParseResult command::parse_args(cxxopts::Options& options, const std::vector<std::string>& args)
{
    // cxxopts expects argv[0] to be the program.
    std::vector<const char*> argv =
      args
      | std::views::transform(
        [](const auto& arg)
        { return arg.data(); })
      | std::ranges::to<std::vector>();
    argv.insert(argv.begin(), "pkg-verify");

    return options.parse(static_cast<int>(argv.size()), argv.data());
}

path_resolver command::make_resolver() const
{
    return path_resolver{make_search_strategy(), env};
}

}    // namespace pkgverify::commandline
