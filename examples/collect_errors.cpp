/**
 * pkgverify - a package dependency verifier.
 *
 * Integration example: collect all problems of a dependency tree.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <cstdlib>
#include <print>
#include <string>
#include <utility>
#include <vector>

#include "environment.h"
#include "resolver.h"
#include "verifier.h"

/**
 * Verify a package and print every problem found, grouped by kind.
 *
 * Usage: collect_errors <directory> <package>
 */
int main(int argc, char* argv[])
{
    if(argc != 3)
    {
        std::println("Usage: {} <directory> <package>", argv[0]);    // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return EXIT_FAILURE;
    }

    const std::string directory = argv[1];    // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const std::string name = argv[2];         // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    // Collect instead of throwing, so a single run reports everything.
    std::vector<std::pair<pkgverify::error_kind, std::string>> problems;
    pkgverify::verify_options options;
    options.error = [&problems](pkgverify::error_kind kind, const std::string& message)
    {
        problems.emplace_back(kind, message);
    };

    pkgverify::verifier v{
      std::move(options),
      pkgverify::path_resolver{pkgverify::make_search_strategy(), pkgverify::environment::from_process(argv[0])}};
    pkgverify::verification_state state = v.verify(directory, name);

    std::println("Checked {} package directories.", state.visited.size());
    for(const auto& binding: state.get_bindings())
    {
        std::println("Native binding: {}", binding);
    }

    for(const auto& [kind, message]: problems)
    {
        std::println("{}: {}", pkgverify::to_string(kind), message);
    }

    return problems.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}
