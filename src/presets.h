/**
 * pkgverify - a package dependency verifier.
 *
 * error policy presets.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "verifier.h"

namespace pkgverify
{

namespace fs = std::filesystem;

/** What happens when an error is reported. */
enum class error_policy
{
    throw_error, /** throw a `std::runtime_error`. */
    warn,        /** print a warning and continue. */
    exit,        /** print the error and terminate the process. */
    stop         /** throw a `verify_error`. */
};

/**
 * Parse a policy name (`throw`, `warn`, `exit` or `stop`).
 *
 * @param name The policy name.
 * @return The policy, or `std::nullopt` if the name is unknown.
 */
std::optional<error_policy> parse_error_policy(const std::string& name);

/** Whether `NODE_DEBUG` requests debug tracing. Evaluated once. */
bool debug_requested();

/**
 * Print a trace message to `stderr`, prefixed with the tool name.
 *
 * @param message The message.
 */
void debug_sink(const std::string& message);

/**
 * Create the callbacks for an error policy.
 *
 * @param policy The error policy.
 * @param debug Whether to enable debug tracing.
 * @return The callbacks.
 */
verify_options make_options(error_policy policy, bool debug);

/**
 * Verify a package with a given error policy.
 *
 * @param policy The error policy.
 * @param directory The directory to resolve the package from.
 * @param name The package name.
 * @param debug Whether to enable debug tracing.
 * @return The verification state.
 */
verification_state run(error_policy policy, const fs::path& directory, const std::string& name, bool debug);

/** Verify, throwing a `std::runtime_error` on the first error. */
verification_state verify(const fs::path& directory, const std::string& name, bool debug = debug_requested());

/** Verify, printing a warning for each error. */
verification_state warn(const fs::path& directory, const std::string& name, bool debug = debug_requested());

/** Verify, terminating the process with a non-zero status on the first error. */
verification_state exit_on_error(const fs::path& directory, const std::string& name, bool debug = debug_requested());

/** Verify, throwing a `verify_error` on the first error. */
verification_state stop(const fs::path& directory, const std::string& name, bool debug = debug_requested());

}    // namespace pkgverify
