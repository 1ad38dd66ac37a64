/**
 * pkgverify - a package dependency verifier.
 *
 * process environment snapshot.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <cstdlib>
#include <system_error>

#include "environment.h"

namespace pkgverify
{

/**
 * Read an environment variable.
 *
 * @param name The variable name.
 * @return The variable's value, or `std::nullopt` if it is not set.
 */
static std::optional<std::string> get_variable(const char* name)
{
    const char* value = std::getenv(name);    // NOLINT(concurrency-mt-unsafe)
    if(value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{value};
}

/**
 * Find the location of the running executable.
 *
 * @param argv0 Fallback program name.
 * @return The executable path, or an empty path if it cannot be determined.
 */
static fs::path find_exec_path(const std::string& argv0)
{
    std::error_code ec;

    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if(!ec && !self.empty())
    {
        return self;
    }

    if(argv0.empty())
    {
        return {};
    }

    fs::path p = fs::absolute(argv0, ec);
    if(ec)
    {
        return {};
    }
    return p.lexically_normal();
}

environment environment::from_process(const std::string& argv0)
{
    environment env;
    env.node_path = get_variable("NODE_PATH");
    env.node_debug = get_variable("NODE_DEBUG");
    env.home = get_variable("HOME");
    env.user_profile = get_variable("USERPROFILE");
    env.exec_path = find_exec_path(argv0);
    return env;
}

bool environment::debug_enabled() const
{
    return node_debug.has_value() && node_debug->find(tool_name) != std::string::npos;
}

}    // namespace pkgverify
