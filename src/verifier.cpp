/**
 * pkgverify - a package dependency verifier.
 *
 * dependency graph verification.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <variant>

#include <fmt/core.h>

#include "semver.h"
#include "utils.h"
#include "verifier.h"

namespace pkgverify
{

std::string to_string(error_kind kind)
{
    switch(kind)
    {
    case error_kind::missing_manifest: return "MissingManifest";
    case error_kind::unreadable_manifest: return "UnreadableManifest";
    case error_kind::malformed_manifest: return "MalformedManifest";
    case error_kind::name_mismatch: return "NameMismatch";
    case error_kind::invalid_field: return "InvalidField";
    case error_kind::invalid_name: return "InvalidName";
    case error_kind::missing_dependency: return "MissingDependency";
    case error_kind::no_version: return "NoVersion";
    case error_kind::invalid_version: return "InvalidVersion";
    case error_kind::unmet_version: return "UnmetVersion";
    }

    throw std::invalid_argument(fmt::format("Invalid error kind {}.", static_cast<int>(kind)));
}

/** Name of a package for messages. */
static std::string display_name(const manifest& pkg)
{
    return pkg.get_name().value_or("<unnamed>");
}

/*
 * verification_state implementation.
 */

std::vector<std::string> verification_state::get_paths() const
{
    std::vector<std::string> paths;
    paths.reserve(visited.size());
    for(const auto& p: visited)
    {
        paths.push_back(p.string());
    }
    return paths;
}

std::vector<std::string> verification_state::get_bindings() const
{
    return {native_bindings.begin(), native_bindings.end()};
}

/*
 * verifier implementation.
 */

verifier::verifier(verify_options options, path_resolver resolver)
: options{std::move(options)}
, resolver{std::move(resolver)}
{
    if(this->options.debug)
    {
        debug(fmt::format("Found global paths: {}", utils::join(this->resolver.get_global_paths(), ", ")));
    }
}

void verifier::debug(const std::string& message) const
{
    if(options.debug)
    {
        options.debug(message);
    }
}

void verifier::error(error_kind kind, const std::string& message) const
{
    if(options.error)
    {
        options.error(kind, message);
        return;
    }

    throw std::runtime_error(message);
}

void verifier::enter(const manifest& pkg, verification_state& state, std::vector<frame>& stack) const
{
    const fs::path& directory = pkg.get_directory();

    // marking before descending makes cycles terminate.
    if(!state.visited.insert(directory).second)
    {
        return;
    }

    if(manifest::has_native_binding(directory))
    {
        state.native_bindings.insert(directory.filename().string());
    }

    frame f{display_name(pkg), directory, {}};

    debug(fmt::format("Verifying package {} at {}.", f.name, directory.string()));

    for(auto field: dependency_fields)
    {
        switch(pkg.get_field_state(field))
        {
        case field_state::absent:
            break;
        case field_state::invalid:
            error(error_kind::invalid_field, fmt::format("Invalid field in package.json: {}.", to_string(field)));
            break;
        case field_state::present:
        {
            auto deps = pkg.get_dependencies(field);
            f.dependencies.insert(f.dependencies.end(), deps.begin(), deps.end());
            break;
        }
        }
    }

    stack.push_back(std::move(f));
}

std::optional<manifest> verifier::verify_dependency(const dependency_declaration& dep, const fs::path& directory) const
{
    const std::string field = to_string(dep.field);

    if(dep.name.empty())
    {
        error(error_kind::invalid_name, fmt::format("Invalid name in {}.", field));
        return std::nullopt;
    }

    // scoped packages and URL specifiers are not verified.
    if(dep.name[0] == '@' || dep.name.find("://") != std::string::npos)
    {
        return std::nullopt;
    }

    if(!dep.range.has_value())
    {
        error(error_kind::invalid_field, fmt::format("Invalid field in {}: {}.", field, dep.name));
        return std::nullopt;
    }

    const std::string& expect = *dep.range;

    std::optional<fs::path> package_directory = resolver.resolve(dep.name, directory);
    if(!package_directory)
    {
        if(dep.field == dependency_field::optional_dependencies)
        {
            debug(fmt::format("Missing optional dependency: {}@{}.", dep.name, expect));
        }
        else
        {
            error(error_kind::missing_dependency, fmt::format("Missing dependency: {}@{}.", dep.name, expect));
        }
        return std::nullopt;
    }

    debug(fmt::format("Opening sub package.json in {}.", package_directory->string()));

    read_result result = manifest::read(*package_directory);
    if(const auto* err = std::get_if<read_error>(&result))
    {
        if(*err == read_error::unreadable)
        {
            error(error_kind::unreadable_manifest, fmt::format("Cannot access package.json: {}@{}.", dep.name, expect));
        }
        else
        {
            error(error_kind::malformed_manifest, fmt::format("Malformed package.json: {}@{}.", dep.name, expect));
        }
        return std::nullopt;
    }

    manifest& pkg = std::get<manifest>(result);

    std::optional<std::string> version = pkg.get_version();
    if(!version)
    {
        error(error_kind::no_version, fmt::format("No version in package.json: {}@{}.", dep.name, expect));
        return std::nullopt;
    }

    // version problems are reported, but the dependency's own tree is still verified.
    if(!semver::is_valid_version(*version))
    {
        error(error_kind::invalid_version, fmt::format("Invalid version for {}@{}: {}.", dep.name, expect, *version));
    }
    else if(!semver::satisfies(*version, expect))
    {
        error(error_kind::unmet_version, fmt::format("Unmet dependency version {}@{}: {}.", dep.name, expect, *version));
    }
    else
    {
        debug(fmt::format("Valid version: {}@{} satisfies {}.", dep.name, *version, expect));
    }

    return std::move(pkg);
}

void verifier::verify_package(const manifest& pkg, verification_state& state) const
{
    std::vector<frame> stack;
    enter(pkg, state, stack);

    while(!stack.empty())
    {
        frame& top = stack.back();
        if(top.next == top.dependencies.size())
        {
            debug(fmt::format("Verified package {}.", top.name));
            stack.pop_back();
            continue;
        }

        // copy, since entering a dependency may reallocate the stack.
        const dependency_declaration dep = top.dependencies[top.next];
        const fs::path directory = top.directory;
        ++top.next;

        std::optional<manifest> dependency = verify_dependency(dep, directory);
        if(dependency)
        {
            enter(*dependency, state, stack);
        }
    }
}

verification_state verifier::verify(const fs::path& start, const std::string& name) const
{
    verification_state state;
    verify(start, name, state);
    return state;
}

void verifier::verify(const fs::path& start, const std::string& name, verification_state& state) const
{
    std::optional<fs::path> package_directory = resolver.resolve(name, start);
    if(!package_directory)
    {
        error(error_kind::missing_manifest, "Missing package.json!");
        return;
    }

    debug(fmt::format("Opening main package.json in {}.", package_directory->string()));

    read_result result = manifest::read(*package_directory);
    if(const auto* err = std::get_if<read_error>(&result))
    {
        if(*err == read_error::unreadable)
        {
            error(error_kind::unreadable_manifest, "Could not open package.json!");
        }
        else
        {
            error(error_kind::malformed_manifest, "Malformed package.json!");
        }
        return;
    }

    const manifest& pkg = std::get<manifest>(result);

    // a mismatch is reported, but the package is verified anyway.
    if(pkg.get_name() != name)
    {
        error(error_kind::name_mismatch, fmt::format("Package name mismatch: {} != {}.", name, display_name(pkg)));
    }

    debug(fmt::format("Opened package.json for {}.", display_name(pkg)));

    verify_package(pkg, state);
}

}    // namespace pkgverify
