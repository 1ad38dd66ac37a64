/**
 * pkgverify - a package dependency verifier.
 *
 * error policy presets.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <cstdio>
#include <cstdlib>
#include <print>

#include "environment.h"
#include "presets.h"

namespace pkgverify
{

std::optional<error_policy> parse_error_policy(const std::string& name)
{
    if(name == "throw")
    {
        return error_policy::throw_error;
    }
    if(name == "warn")
    {
        return error_policy::warn;
    }
    if(name == "exit")
    {
        return error_policy::exit;
    }
    if(name == "stop")
    {
        return error_policy::stop;
    }
    return std::nullopt;
}

bool debug_requested()
{
    static const bool requested = environment::from_process().debug_enabled();
    return requested;
}

void debug_sink(const std::string& message)
{
    std::println(stderr, "{}: {}", tool_name, message);
}

verify_options make_options(error_policy policy, bool debug)
{
    verify_options options;

    if(debug)
    {
        options.debug = debug_sink;
    }

    switch(policy)
    {
    case error_policy::throw_error:
        // an empty callback throws.
        break;
    case error_policy::warn:
        options.error = [](error_kind, const std::string& message)
        {
            std::println(stderr, "{}: {}", tool_name, message);
        };
        break;
    case error_policy::exit:
        options.error = [](error_kind, const std::string& message)
        {
            std::println(stderr, "{}: {}", tool_name, message);
            std::exit(EXIT_FAILURE);    // NOLINT(concurrency-mt-unsafe)
        };
        break;
    case error_policy::stop:
        options.error = [](error_kind kind, const std::string& message)
        {
            throw verify_error(kind, message);
        };
        break;
    }

    return options;
}

verification_state run(error_policy policy, const fs::path& directory, const std::string& name, bool debug)
{
    verifier v{make_options(policy, debug)};
    return v.verify(directory, name);
}

verification_state verify(const fs::path& directory, const std::string& name, bool debug)
{
    return run(error_policy::throw_error, directory, name, debug);
}

verification_state warn(const fs::path& directory, const std::string& name, bool debug)
{
    return run(error_policy::warn, directory, name, debug);
}

verification_state exit_on_error(const fs::path& directory, const std::string& name, bool debug)
{
    return run(error_policy::exit, directory, name, debug);
}

verification_state stop(const fs::path& directory, const std::string& name, bool debug)
{
    return run(error_policy::stop, directory, name, debug);
}

}    // namespace pkgverify
