/**
 * pkgverify - a package dependency verifier.
 *
 * platform-dependent search path enumeration.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "environment.h"

namespace pkgverify
{

/**
 * Platform rules for locating installed packages.
 *
 * Paths are handled as strings in the syntax of the strategy's platform,
 * independent of the host the code runs on.
 */
class search_strategy
{
protected:
    /** Name of the per-directory package installation folder. */
    inline static const std::string modules_dir = "node_modules";

    /**
     * Whether a character separates path segments for the ancestor walk.
     *
     * @param c The character to check.
     */
    virtual bool ends_segment(char c) const = 0;

    /**
     * Build the candidate list for all ancestors of a path by walking it
     * backwards segment by segment. No candidate is produced for an ancestor
     * whose last segment is `node_modules`.
     *
     * @param from A normalized absolute path.
     * @return The candidates, innermost first.
     */
    std::vector<std::string> scan_ancestors(const std::string& from) const;

    /**
     * Append a component to a path using the platform separator.
     *
     * @param base The base path.
     * @param component The component to append.
     * @return The joined path.
     */
    std::string join(const std::string& base, const std::string& component) const;

    /**
     * Split a path list at the platform delimiter, discarding empty entries.
     *
     * @param list The path list.
     * @return The non-empty entries.
     */
    std::vector<std::string> split_path_list(const std::string& list) const;

public:
    /** Default destructor. */
    virtual ~search_strategy() = default;

    /** Path separator. */
    virtual char get_separator() const = 0;

    /** Delimiter for path lists such as `NODE_PATH`. */
    virtual char get_delimiter() const = 0;

    /**
     * Whether the path denotes a filesystem root.
     *
     * @param path A normalized absolute path.
     */
    virtual bool is_root(const std::string& path) const = 0;

    /**
     * Remove trailing separators, keeping the root intact.
     *
     * @param path The path to normalize.
     * @return The normalized path.
     */
    virtual std::string normalize(const std::string& path) const = 0;

    /**
     * Whether a requested name is a path rather than a package name, i.e.
     * whether it starts with `.` or `/`.
     *
     * @param name The requested name.
     */
    bool is_path_request(const std::string& name) const;

    /**
     * Enumerate the `node_modules` candidates for a directory and all its ancestors.
     *
     * @param from An absolute directory path.
     * @return The candidate directories, innermost first.
     */
    virtual std::vector<std::string> node_modules_paths(const std::string& from) const = 0;

    /**
     * Compute the global fallback search paths.
     *
     * @param env The environment.
     * @return The global paths in lookup order.
     */
    virtual std::vector<std::string> global_paths(const environment& env) const = 0;
};

/** Search rules for POSIX systems. */
class posix_search_strategy : public search_strategy
{
protected:
    bool ends_segment(char c) const override;

public:
    char get_separator() const override
    {
        return '/';
    }

    char get_delimiter() const override
    {
        return ':';
    }

    bool is_root(const std::string& path) const override;
    std::string normalize(const std::string& path) const override;
    std::vector<std::string> node_modules_paths(const std::string& from) const override;
    std::vector<std::string> global_paths(const environment& env) const override;
};

/** Search rules for Windows. */
class windows_search_strategy : public search_strategy
{
protected:
    bool ends_segment(char c) const override;

    /**
     * Get the parent directory of a path.
     *
     * @param path A normalized path.
     * @return The parent path, or the path itself if it is a root.
     */
    std::string parent(const std::string& path) const;

public:
    char get_separator() const override
    {
        return '\\';
    }

    char get_delimiter() const override
    {
        return ';';
    }

    bool is_root(const std::string& path) const override;
    std::string normalize(const std::string& path) const override;
    std::vector<std::string> node_modules_paths(const std::string& from) const override;
    std::vector<std::string> global_paths(const environment& env) const override;
};

/**
 * Create the search strategy for the platform the program was built for.
 *
 * @return The platform's search strategy.
 */
std::shared_ptr<const search_strategy> make_search_strategy();

}    // namespace pkgverify
