/**
 * pkgverify - a package dependency verifier.
 *
 * `resolve` and `paths` command implementations.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <format>
#include <print>

#include "commandline.h"
#include "resolver.h"

namespace pkgverify::commandline
{

/*
 * resolve implementation.
 */

resolve::resolve(const std::string& program_name, const pkgverify::environment& env)
: command{"resolve", program_name, env}
{
}

void resolve::invoke(const std::vector<std::string>& args)
{
    cxxopts::Options options = make_cxxopts_options();

    add_directory_option(options, "Directory to resolve the package from.");
    options.add_options()("name", "The package to resolve", cxxopts::value<std::string>());

    options.parse_positional({"name"});
    options.positional_help("name");
    auto result = parse_args(options, args);

    if(result.count("help") > 0 || result.count("name") < 1)
    {
        std::println("{}", options.help());
        return;
    }

    const std::string package_name = result["name"].as<std::string>();
    const fs::path directory = get_directory(result);

    path_resolver resolver = make_resolver();
    auto package_directory = resolver.resolve(package_name, directory);
    if(!package_directory)
    {
        throw std::runtime_error(std::format("Cannot find package '{}' from '{}'.", package_name, directory.string()));
    }

    std::println("{}", package_directory->string());
}

std::string resolve::get_description() const
{
    return "Print the directory a package resolves to.";
}

/*
 * paths implementation.
 */

paths::paths(const std::string& program_name, const pkgverify::environment& env)
: command{"paths", program_name, env}
{
}

void paths::invoke(const std::vector<std::string>& args)
{
    cxxopts::Options options = make_cxxopts_options();

    add_directory_option(options, "Directory to list the search paths for.");

    auto result = parse_args(options, args);

    if(result.count("help") > 0)
    {
        std::println("{}", options.help());
        return;
    }

    const fs::path directory = get_directory(result);

    path_resolver resolver = make_resolver();
    for(const auto& p: resolver.get_module_paths(directory))
    {
        std::println("{}", p);
    }
}

std::string paths::get_description() const
{
    return "List the directories searched for packages, in lookup order.";
}

}    // namespace pkgverify::commandline
