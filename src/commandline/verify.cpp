/**
 * pkgverify - a package dependency verifier.
 *
 * `verify` command implementation.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <format>
#include <print>

#include "commandline.h"
#include "presets.h"
#include "utils.h"
#include "verifier.h"

namespace pkgverify::commandline
{

verify::verify(const std::string& program_name, const pkgverify::environment& env)
: command{"verify", program_name, env}
{
}

void verify::invoke(const std::vector<std::string>& args)
{
    cxxopts::Options options = make_cxxopts_options();

    // clang-format off
    options.add_options()
        ("v,verbose", "Verbose output.")
        ("debug", "Trace resolution and verification steps.")
        ("p,policy", "Error policy, one of {throw|warn|exit|stop}.", cxxopts::value<std::string>()->default_value("throw"))
        ("name", "The package to verify", cxxopts::value<std::string>());
    // clang-format on
    add_directory_option(options, "Directory to resolve the package from.");

    options.parse_positional({"name"});
    options.positional_help("name");
    auto result = parse_args(options, args);

    if(result.count("help") > 0 || result.count("name") < 1)
    {
        std::println("{}", options.help());
        return;
    }

    bool verbose = result.count("verbose") > 0;
    bool debug = result.count("debug") > 0 || env.debug_enabled();

    const std::string policy_name = result["policy"].as<std::string>();
    auto policy = parse_error_policy(policy_name);
    if(!policy)
    {
        throw std::runtime_error(std::format("Unknown error policy '{}'.", policy_name));
    }

    const std::string package_name = result["name"].as<std::string>();
    const fs::path directory = get_directory(result);

    if(verbose)
    {
        std::println("Info: Verifying '{}' from '{}'.", package_name, directory.string());
    }

    // count reported errors, so that a run with warnings still fails.
    std::size_t error_count = 0;
    verify_options verify_opts = make_options(*policy, debug);
    verify_opts.error = [&error_count, report = std::move(verify_opts.error)](error_kind kind, const std::string& message)
    {
        ++error_count;
        if(report)
        {
            report(kind, message);
        }
        else
        {
            throw std::runtime_error(message);
        }
    };

    pkgverify::verifier v{std::move(verify_opts), make_resolver()};
    verification_state state = v.verify(directory, package_name);

    if(verbose)
    {
        std::println("Info: Verified {} package directories.", state.visited.size());

        auto bindings = state.get_bindings();
        if(!bindings.empty())
        {
            std::println("Info: Packages with native bindings: {}", utils::join(bindings, ", "));
        }
    }

    if(error_count > 0)
    {
        throw std::runtime_error(std::format("Verification of '{}' reported {} error(s).", package_name, error_count));
    }

    if(verbose)
    {
        std::println("Info: '{}' is valid.", package_name);
    }
}

std::string verify::get_description() const
{
    return "Verify that the dependency tree of a package is installed.";
}

}    // namespace pkgverify::commandline
