/**
 * pkgverify - a package dependency verifier.
 *
 * On-disk package trees for tests.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "environment.h"
#include "resolver.h"
#include "search_strategy.h"

namespace pkgverify::test
{

namespace fs = std::filesystem;

/**
 * A directory tree below the system temporary directory, named after the
 * running test. Removed on destruction.
 */
class package_tree
{
    /** The tree's root directory (canonical). */
    fs::path root;

public:
    /** Create an empty tree for the running test. */
    package_tree()
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string name = std::format("pkgverify_{}_{}", info->test_suite_name(), info->name());

        root = fs::canonical(fs::temp_directory_path()) / name;
        fs::remove_all(root);
        fs::create_directories(root);
    }

    /** Remove the tree. */
    ~package_tree()
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    package_tree(const package_tree&) = delete;
    package_tree& operator=(const package_tree&) = delete;

    /** Get the root directory. */
    const fs::path& get_root() const
    {
        return root;
    }

    /**
     * Create a directory.
     *
     * @param rel Path relative to the root.
     * @return The absolute path.
     */
    fs::path add_directory(const fs::path& rel) const
    {
        fs::path p = root / rel;
        fs::create_directories(p);
        return p;
    }

    /**
     * Create a file, including its parent directories.
     *
     * @param rel Path relative to the root.
     * @param contents The file contents.
     * @return The absolute path.
     */
    fs::path add_file(const fs::path& rel, const std::string& contents) const
    {
        fs::path p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out{p, std::ios::out | std::ios::binary | std::ios::trunc};
        out << contents;
        return p;
    }

    /**
     * Create a package directory with a `package.json`.
     *
     * @param rel Package directory relative to the root.
     * @param manifest_text The manifest contents.
     * @return The package directory.
     */
    fs::path add_package(const fs::path& rel, const std::string& manifest_text) const
    {
        add_file(rel / "package.json", manifest_text);
        return root / rel;
    }
};

/** An environment without global search paths. */
inline environment make_isolated_environment()
{
    return environment{};
}

/** A resolver using the POSIX rules and no global search paths. */
inline path_resolver make_isolated_resolver()
{
    return path_resolver{std::make_shared<posix_search_strategy>(), make_isolated_environment()};
}

}    // namespace pkgverify::test
