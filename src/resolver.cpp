/**
 * pkgverify - a package dependency verifier.
 *
 * package directory resolution.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <system_error>

#include "resolver.h"

namespace pkgverify
{

/**
 * Check whether a path names a directory. Any error (missing path, missing
 * permissions) is reported as "not a directory".
 */
static bool directory_exists(const fs::path& p) noexcept
{
    std::error_code ec;
    return fs::is_directory(p, ec);
}

/**
 * Return the canonical form of an existing directory.
 *
 * @param p The directory.
 * @return The canonical path, or `std::nullopt` if it cannot be obtained.
 */
static std::optional<fs::path> canonical_directory(const fs::path& p)
{
    std::error_code ec;
    fs::path result = fs::canonical(p, ec);
    if(ec)
    {
        return std::nullopt;
    }
    return result;
}

/**
 * Make the requesting directory absolute.
 *
 * @param from The directory.
 * @return The absolute, lexically normal directory.
 */
static fs::path absolute_directory(const fs::path& from)
{
    std::error_code ec;
    fs::path result = fs::absolute(from, ec);
    if(ec)
    {
        return from.lexically_normal();
    }
    return result.lexically_normal();
}

path_resolver::path_resolver()
: path_resolver{make_search_strategy(), environment::from_process()}
{
}

path_resolver::path_resolver(std::shared_ptr<const search_strategy> strategy, const environment& env)
: strategy{std::move(strategy)}
{
    global_paths = this->strategy->global_paths(env);
}

std::optional<fs::path> path_resolver::resolve(const std::string& name, const fs::path& from) const
{
    if(name.empty())
    {
        return std::nullopt;
    }

    if(strategy->is_path_request(name))
    {
        const fs::path base = (absolute_directory(from) / name).lexically_normal();
        if(!directory_exists(base))
        {
            return std::nullopt;
        }
        return canonical_directory(base);
    }

    for(const auto& candidate: get_module_paths(from))
    {
        if(!directory_exists(candidate))
        {
            continue;
        }

        const fs::path base = fs::path{candidate} / name;
        if(!directory_exists(base))
        {
            continue;
        }

        return canonical_directory(base);
    }

    return std::nullopt;
}

std::vector<std::string> path_resolver::get_module_paths(const fs::path& from) const
{
    std::vector<std::string> paths = strategy->node_modules_paths(absolute_directory(from).string());
    paths.insert(paths.end(), global_paths.begin(), global_paths.end());
    return paths;
}

}    // namespace pkgverify
