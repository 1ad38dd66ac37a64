/**
 * pkgverify - a package dependency verifier.
 *
 * package directory resolution.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "environment.h"
#include "search_strategy.h"

namespace pkgverify
{

namespace fs = std::filesystem;

/**
 * Locates installed packages the way a CommonJS module loader does: relative
 * and absolute requests are resolved against the requesting directory, bare
 * names are searched in the `node_modules` directories of the requesting
 * directory and all its ancestors, followed by the global search paths.
 */
class path_resolver
{
    /** The platform search rules. */
    std::shared_ptr<const search_strategy> strategy;

    /** Global search paths, computed once at construction. */
    std::vector<std::string> global_paths;

public:
    /**
     * Create a resolver for the current platform and process environment.
     */
    path_resolver();

    /**
     * Create a resolver.
     *
     * @param strategy The platform search rules.
     * @param env The environment used to compute the global search paths.
     */
    path_resolver(std::shared_ptr<const search_strategy> strategy, const environment& env);

    /** Default copy and move constructors. */
    path_resolver(const path_resolver&) = default;
    path_resolver(path_resolver&&) = default;

    /** Default assignments. */
    path_resolver& operator=(const path_resolver&) = default;
    path_resolver& operator=(path_resolver&&) = default;

    /**
     * Find the directory of a package.
     *
     * @param name The package name, or a path starting with `.` or `/`.
     * @param from The directory the request originates from.
     * @return The canonical package directory, or `std::nullopt` if the package was not found.
     */
    [[nodiscard]]
    std::optional<fs::path> resolve(const std::string& name, const fs::path& from) const;

    /**
     * Get the ordered list of directories searched for bare package names.
     *
     * @param from The directory the request originates from.
     * @return The ancestor `node_modules` candidates followed by the global paths.
     */
    std::vector<std::string> get_module_paths(const fs::path& from) const;

    /** Get the global search paths. */
    const std::vector<std::string>& get_global_paths() const
    {
        return global_paths;
    }
};

}    // namespace pkgverify
