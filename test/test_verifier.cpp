/**
 * pkgverify - a package dependency verifier.
 *
 * Dependency graph verification tests.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <algorithm>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "package_tree.h"
#include "verifier.h"

namespace
{

namespace fs = std::filesystem;
namespace pt = pkgverify::test;

using pkgverify::error_kind;

/** Records errors and traces of a verification run. */
struct recorder
{
    std::vector<std::pair<error_kind, std::string>> errors;
    std::vector<std::string> traces;

    pkgverify::verifier make_verifier()
    {
        pkgverify::verify_options options;
        options.debug = [this](const std::string& message)
        {
            traces.push_back(message);
        };
        options.error = [this](error_kind kind, const std::string& message)
        {
            errors.emplace_back(kind, message);
        };
        return pkgverify::verifier{std::move(options), pt::make_isolated_resolver()};
    }

    std::size_t count_traces(const std::string& prefix) const
    {
        return std::count_if(
          traces.begin(),
          traces.end(),
          [&prefix](const std::string& t) -> bool
          {
              return t.starts_with(prefix);
          });
    }
};

TEST(verifier, satisfied_dependency)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"left-pad": "^1.0.0"}})");
    tree.add_package("node_modules/left-pad", R"({"name": "left-pad", "version": "1.2.0"})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(state.visited.size(), 2U);
    EXPECT_TRUE(state.visited.contains(tree.get_root() / "node_modules" / "left-pad"));
    EXPECT_EQ(r.count_traces("Valid version: left-pad@1.2.0 satisfies ^1.0.0."), 1U);
}

TEST(verifier, unmet_version)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"left-pad": "^1.0.0"}})");
    tree.add_package("node_modules/left-pad", R"({"name": "left-pad", "version": "2.0.0"})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].first, error_kind::unmet_version);
    EXPECT_EQ(r.errors[0].second, "Unmet dependency version left-pad@^1.0.0: 2.0.0.");

    // the dependency is still verified.
    EXPECT_EQ(state.visited.size(), 2U);
}

TEST(verifier, missing_optional_dependency)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "optionalDependencies": {"fsevents": "^1.0.0"}})");

    recorder r;
    r.make_verifier().verify(tree.get_root(), "app");

    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(r.count_traces("Missing optional dependency: fsevents@^1.0.0."), 1U);
}

TEST(verifier, missing_dependencies)
{
    pt::package_tree tree;
    tree.add_package(
      "node_modules/app",
      R"({"name": "app", "dependencies": {"a": "1.0.0"}, "peerDependencies": {"b": "*"}})");

    recorder r;
    r.make_verifier().verify(tree.get_root(), "app");

    ASSERT_EQ(r.errors.size(), 2U);
    EXPECT_EQ(r.errors[0].first, error_kind::missing_dependency);
    EXPECT_EQ(r.errors[0].second, "Missing dependency: a@1.0.0.");
    EXPECT_EQ(r.errors[1].first, error_kind::missing_dependency);
    EXPECT_EQ(r.errors[1].second, "Missing dependency: b@*.");
}

TEST(verifier, malformed_dependency_manifest)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"broken": "*"}})");
    tree.add_package("node_modules/broken", R"({"name": "broken", "version": "1.0.0", "dependencies": )");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].first, error_kind::malformed_manifest);
    EXPECT_EQ(r.errors[0].second, "Malformed package.json: broken@*.");
    EXPECT_EQ(state.visited.size(), 1U);
}

TEST(verifier, unreadable_dependency_manifest)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"empty": "*"}})");
    tree.add_directory("node_modules/empty");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].first, error_kind::unreadable_manifest);
    EXPECT_EQ(r.errors[0].second, "Cannot access package.json: empty@*.");
    EXPECT_EQ(state.visited.size(), 1U);
}

TEST(verifier, native_bindings)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"native": "^1.0.0"}})");
    tree.add_package(
      "node_modules/native",
      R"({"name": "native", "version": "1.0.0", "dependencies": {"nan": "^2.0.0"}})");
    tree.add_file("node_modules/native/binding.gyp", "{}");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    // the missing dependency does not affect the binding record.
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].first, error_kind::missing_dependency);
    EXPECT_EQ(state.get_bindings(), std::vector<std::string>{"native"});
}

TEST(verifier, cycles)
{
    pt::package_tree tree;
    tree.add_package("node_modules/a", R"({"name": "a", "version": "1.0.0", "dependencies": {"b": "1.0.0"}})");
    tree.add_package("node_modules/b", R"({"name": "b", "version": "1.0.0", "dependencies": {"a": "1.0.0"}})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "a");

    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(state.visited.size(), 2U);
    EXPECT_EQ(r.count_traces("Verifying package"), 2U);
}

TEST(verifier, diamond)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"x": "*", "y": "*"}})");
    tree.add_package("node_modules/x", R"({"name": "x", "version": "1.0.0", "dependencies": {"shared": "^1.0.0"}})");
    tree.add_package("node_modules/y", R"({"name": "y", "version": "1.0.0", "dependencies": {"shared": "^2.0.0"}})");
    tree.add_package("node_modules/shared", R"({"name": "shared", "version": "1.0.0"})");
    tree.add_package("node_modules/y/node_modules/shared", R"({"name": "shared", "version": "2.0.0"})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(state.visited.size(), 5U);
}

TEST(verifier, shared_dependency_verified_once)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"x": "*", "y": "*"}})");
    tree.add_package("node_modules/x", R"({"name": "x", "version": "1.0.0", "dependencies": {"shared": "^1.0.0"}})");
    tree.add_package("node_modules/y", R"({"name": "y", "version": "1.0.0", "dependencies": {"shared": "^1.0.0"}})");
    tree.add_package("node_modules/shared", R"({"name": "shared", "version": "1.5.0"})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(state.visited.size(), 4U);
    EXPECT_EQ(r.count_traces("Verifying package shared"), 1U);

    const fs::path modules = tree.get_root() / "node_modules";
    EXPECT_EQ(
      state.get_paths(),
      (std::vector<std::string>{
        (modules / "app").string(),
        (modules / "shared").string(),
        (modules / "x").string(),
        (modules / "y").string()}));

    // both edges are checked.
    EXPECT_EQ(r.count_traces("Valid version: shared@1.5.0"), 2U);
}

TEST(verifier, state_reuse)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"left-pad": "^1.0.0"}})");
    tree.add_package("node_modules/left-pad", R"({"name": "left-pad", "version": "1.2.0"})");

    recorder r;
    auto v = r.make_verifier();

    pkgverify::verification_state state;
    v.verify(tree.get_root(), "app", state);
    EXPECT_EQ(r.count_traces("Verifying package"), 2U);

    r.traces.clear();
    v.verify(tree.get_root(), "app", state);
    EXPECT_EQ(r.count_traces("Verifying package"), 0U);
    EXPECT_EQ(state.visited.size(), 2U);

    // fresh state for each call.
    r.traces.clear();
    v.verify(tree.get_root(), "app");
    EXPECT_EQ(r.count_traces("Verifying package"), 2U);
    EXPECT_TRUE(r.errors.empty());
}

TEST(verifier, skipped_names)
{
    pt::package_tree tree;
    tree.add_package(
      "node_modules/app",
      R"({"name": "app", "dependencies": {"@scope/pkg": "^1.0.0", "git://example.com/x.git": "*"}})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(state.visited.size(), 1U);
}

TEST(verifier, invalid_fields)
{
    pt::package_tree tree;
    tree.add_package(
      "node_modules/app",
      R"({"name": "app",
          "dependencies": "left-pad",
          "peerDependencies": {"bad": 1, "": "*"},
          "optionalDependencies": {"left-pad": "^1.0.0"}})");
    tree.add_package("node_modules/left-pad", R"({"name": "left-pad", "version": "1.2.0"})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    ASSERT_EQ(r.errors.size(), 3U);
    EXPECT_EQ(r.errors[0].first, error_kind::invalid_field);
    EXPECT_EQ(r.errors[0].second, "Invalid field in package.json: dependencies.");
    EXPECT_EQ(r.errors[1].first, error_kind::invalid_field);
    EXPECT_EQ(r.errors[1].second, "Invalid field in peerDependencies: bad.");
    EXPECT_EQ(r.errors[2].first, error_kind::invalid_name);
    EXPECT_EQ(r.errors[2].second, "Invalid name in peerDependencies.");

    // the remaining fields are still verified.
    EXPECT_EQ(state.visited.size(), 2U);
}

TEST(verifier, version_errors)
{
    pt::package_tree tree;
    tree.add_package(
      "node_modules/app",
      R"({"name": "app", "dependencies": {"none": "*", "weird": "*"}})");
    tree.add_package("node_modules/none", R"({"name": "none", "dependencies": {"deep": "*"}})");
    tree.add_package(
      "node_modules/weird",
      R"({"name": "weird", "version": "latest", "dependencies": {"deep": "*"}})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    ASSERT_EQ(r.errors.size(), 3U);
    EXPECT_EQ(r.errors[0].first, error_kind::no_version);
    EXPECT_EQ(r.errors[0].second, "No version in package.json: none@*.");
    EXPECT_EQ(r.errors[1].first, error_kind::invalid_version);
    EXPECT_EQ(r.errors[1].second, "Invalid version for weird@*: latest.");

    // a package with an invalid version is still traversed.
    EXPECT_EQ(r.errors[2].first, error_kind::missing_dependency);
    EXPECT_EQ(r.errors[2].second, "Missing dependency: deep@*.");

    EXPECT_FALSE(state.visited.contains(tree.get_root() / "node_modules" / "none"));
    EXPECT_TRUE(state.visited.contains(tree.get_root() / "node_modules" / "weird"));
}

TEST(verifier, root_errors)
{
    pt::package_tree tree;
    tree.add_package("node_modules/malformed", "not json");
    tree.add_directory("node_modules/empty");

    recorder r;
    auto v = r.make_verifier();

    auto state = v.verify(tree.get_root(), "missing");
    v.verify(tree.get_root(), "malformed");
    v.verify(tree.get_root(), "empty");

    ASSERT_EQ(r.errors.size(), 3U);
    EXPECT_EQ(r.errors[0].first, error_kind::missing_manifest);
    EXPECT_EQ(r.errors[0].second, "Missing package.json!");
    EXPECT_EQ(r.errors[1].first, error_kind::malformed_manifest);
    EXPECT_EQ(r.errors[1].second, "Malformed package.json!");
    EXPECT_EQ(r.errors[2].first, error_kind::unreadable_manifest);
    EXPECT_EQ(r.errors[2].second, "Could not open package.json!");
    EXPECT_TRUE(state.visited.empty());
}

TEST(verifier, name_mismatch)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "other", "dependencies": {"missing": "*"}})");

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "app");

    // the package is verified anyway.
    ASSERT_EQ(r.errors.size(), 2U);
    EXPECT_EQ(r.errors[0].first, error_kind::name_mismatch);
    EXPECT_EQ(r.errors[0].second, "Package name mismatch: app != other.");
    EXPECT_EQ(r.errors[1].first, error_kind::missing_dependency);
    EXPECT_EQ(state.visited.size(), 1U);
}

TEST(verifier, default_error_handling_throws)
{
    pt::package_tree tree;
    tree.add_package("node_modules/app", R"({"name": "app", "dependencies": {"missing": "*"}})");

    pkgverify::verifier v{{}, pt::make_isolated_resolver()};
    EXPECT_THROW(v.verify(tree.get_root(), "app"), std::runtime_error);
}

TEST(verifier, deep_chain)
{
    constexpr int depth = 1000;

    pt::package_tree tree;
    for(int i = 0; i < depth; ++i)
    {
        const std::string deps = (i + 1 < depth)
                                   ? std::format(R"({{"p{}": "^1.0.0"}})", i + 1)
                                   : std::string{"{}"};
        tree.add_package(
          std::format("node_modules/p{}", i),
          std::format(R"({{"name": "p{}", "version": "1.0.0", "dependencies": {}}})", i, deps));
    }

    recorder r;
    auto state = r.make_verifier().verify(tree.get_root(), "p0");

    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(state.visited.size(), static_cast<std::size_t>(depth));
}

TEST(verifier, error_kind_names)
{
    EXPECT_EQ(pkgverify::to_string(error_kind::missing_manifest), "MissingManifest");
    EXPECT_EQ(pkgverify::to_string(error_kind::unmet_version), "UnmetVersion");
    EXPECT_EQ(pkgverify::to_string(error_kind::invalid_name), "InvalidName");
}

}    // namespace
