/**
 * pkgverify - a package dependency verifier.
 *
 * process environment snapshot.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace pkgverify
{

namespace fs = std::filesystem;

/** The tool name, as matched against `NODE_DEBUG` and used as a message prefix. */
inline const std::string tool_name = "pkg-verify";

/**
 * The environment variables and process properties that influence
 * package resolution. Taken once, so that resolution does not depend on
 * changes to the process environment during a run.
 */
struct environment
{
    /** Extra global search roots (`NODE_PATH`). */
    std::optional<std::string> node_path;

    /** Debug selector (`NODE_DEBUG`). */
    std::optional<std::string> node_debug;

    /** Home directory on POSIX systems (`HOME`). */
    std::optional<std::string> home;

    /** Home directory on Windows (`USERPROFILE`). */
    std::optional<std::string> user_profile;

    /** Location of the running executable. */
    fs::path exec_path;

    /**
     * Read the environment of the current process.
     *
     * @param argv0 The program name as passed to `main`, used to locate the
     *              executable where the platform does not report it.
     * @return The environment snapshot.
     */
    static environment from_process(const std::string& argv0 = {});

    /** Whether debug tracing was requested through `NODE_DEBUG`. */
    bool debug_enabled() const;
};

}    // namespace pkgverify
