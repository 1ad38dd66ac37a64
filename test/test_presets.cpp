/**
 * pkgverify - a package dependency verifier.
 *
 * Error policy preset tests.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <string>

#include <gtest/gtest.h>

#include "package_tree.h"
#include "presets.h"

namespace
{

namespace pt = pkgverify::test;

using pkgverify::error_kind;
using pkgverify::error_policy;

TEST(presets, parse_error_policy)
{
    EXPECT_EQ(pkgverify::parse_error_policy("throw"), error_policy::throw_error);
    EXPECT_EQ(pkgverify::parse_error_policy("warn"), error_policy::warn);
    EXPECT_EQ(pkgverify::parse_error_policy("exit"), error_policy::exit);
    EXPECT_EQ(pkgverify::parse_error_policy("stop"), error_policy::stop);
    EXPECT_FALSE(pkgverify::parse_error_policy("ignore").has_value());
    EXPECT_FALSE(pkgverify::parse_error_policy("").has_value());
}

TEST(presets, verify_throws)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"missing": "*"}})");

    EXPECT_THROW(pkgverify::verify(tree.get_root(), "app", false), std::runtime_error);
}

TEST(presets, warn_continues)
{
    pt::package_tree tree;
    tree.add_package(
      "node_modules/app",
      R"({"name": "app", "dependencies": {"a": "^1.0.0", "b": "^1.0.0"}})");
    tree.add_package("node_modules/b", R"({"name": "b", "version": "1.0.0"})");

    testing::internal::CaptureStderr();
    auto state = pkgverify::warn(tree.get_root(), "app", false);
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("pkg-verify: Missing dependency: a@^1.0.0."), std::string::npos);
    EXPECT_EQ(state.visited.size(), 2U);
}

TEST(presets, stop_throws_verify_error)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"missing": "^2.0.0"}})");

    try
    {
        pkgverify::stop(tree.get_root(), "app", false);
        FAIL() << "Expected a verify_error.";
    }
    catch(const pkgverify::verify_error& e)
    {
        EXPECT_EQ(e.get_kind(), error_kind::missing_dependency);
        EXPECT_EQ(e.get_code(), "ERR_PKGVERIFY");
        EXPECT_EQ(std::string{e.what()}, "Missing dependency: missing@^2.0.0.");
    }
}

TEST(presets, exit_on_error)
{
    pt::package_tree tree;

    EXPECT_EXIT(
      pkgverify::exit_on_error(tree.get_root(), "app", false),
      testing::ExitedWithCode(1),
      "pkg-verify: Missing package.json!");
}

TEST(presets, debug_output)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "optionalDependencies": {"fsevents": "*"}})");

    testing::internal::CaptureStderr();
    pkgverify::warn(tree.get_root(), "app", true);
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("pkg-verify: Verifying package app at"), std::string::npos);
    EXPECT_NE(output.find("pkg-verify: Missing optional dependency: fsevents@*."), std::string::npos);
    EXPECT_NE(output.find("pkg-verify: Verified package app."), std::string::npos);
}

TEST(presets, options)
{
    auto quiet = pkgverify::make_options(error_policy::throw_error, false);
    EXPECT_FALSE(quiet.debug);
    EXPECT_FALSE(quiet.error);

    auto stop = pkgverify::make_options(error_policy::stop, true);
    EXPECT_TRUE(stop.debug);
    ASSERT_TRUE(stop.error);
    EXPECT_THROW(stop.error(error_kind::no_version, "No version."), pkgverify::verify_error);
}

}    // namespace
