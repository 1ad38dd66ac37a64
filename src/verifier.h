/**
 * pkgverify - a package dependency verifier.
 *
 * dependency graph verification.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "manifest.h"
#include "resolver.h"

namespace pkgverify
{

namespace fs = std::filesystem;

/** Kinds of verification errors. */
enum class error_kind
{
    missing_manifest,    /** no directory was found for the requested package. */
    unreadable_manifest, /** the manifest file is inaccessible. */
    malformed_manifest,  /** the manifest does not decode to an object. */
    name_mismatch,       /** the manifest declares a different name than requested. */
    invalid_field,       /** a dependency map is not a mapping, or a range is not a string. */
    invalid_name,        /** an empty dependency name. */
    missing_dependency,  /** a required dependency is not installed. */
    no_version,          /** the dependency's manifest has no version string. */
    invalid_version,     /** the installed version is not a semantic version. */
    unmet_version        /** the installed version does not satisfy the declared range. */
};

/**
 * Get a stable name for an error kind.
 *
 * @param kind The error kind.
 * @return The name, e.g. `UnmetVersion`.
 */
std::string to_string(error_kind kind);

/** A verification error carrying a machine-readable code. */
class verify_error : public std::runtime_error
{
    /** The error kind. */
    error_kind kind;

public:
    /** The error code shared by all verification errors. */
    inline static const std::string code = "ERR_PKGVERIFY";

    /**
     * Construct a `verify_error`.
     *
     * @param kind The error kind.
     * @param message The error message.
     */
    verify_error(error_kind kind, const std::string& message)
    : std::runtime_error{message}
    , kind{kind}
    {
    }

    /** Get the error kind. */
    error_kind get_kind() const
    {
        return kind;
    }

    /** Get the error code. */
    const std::string& get_code() const
    {
        return code;
    }
};

/**
 * Side effects of a verification run. The verifier never decides whether an
 * error is fatal; the `error` callback does.
 */
struct verify_options
{
    /** Receives trace messages. Tracing is disabled if empty. */
    std::function<void(const std::string&)> debug;

    /** Receives errors. If empty, errors are thrown as `std::runtime_error`. */
    std::function<void(error_kind, const std::string&)> error;
};

/** Per-run verification state. */
struct verification_state
{
    /** Package directories that were verified. */
    std::set<fs::path> visited;

    /** Names of package directories containing a native build descriptor. */
    std::set<std::string> native_bindings;

    /** Get the verified package directories, sorted. */
    std::vector<std::string> get_paths() const;

    /** Get the native binding packages, sorted. */
    std::vector<std::string> get_bindings() const;
};

/**
 * Verifies that the dependency tree of a package is installed and that all
 * installed versions satisfy their declared ranges.
 */
class verifier
{
    /** A package whose dependencies are being verified. */
    struct frame
    {
        /** Package name, for messages. */
        std::string name;

        /** Package directory. Dependencies are resolved relative to it. */
        fs::path directory;

        /** The declared dependencies. */
        std::vector<dependency_declaration> dependencies;

        /** Index of the next dependency to verify. */
        std::size_t next{0};
    };

    /** Callbacks. */
    verify_options options;

    /** Package directory resolver. */
    path_resolver resolver;

    /** Emit a trace message. */
    void debug(const std::string& message) const;

    /** Report an error. */
    void error(error_kind kind, const std::string& message) const;

    /**
     * Start verifying a package. Does nothing if its directory was already visited.
     *
     * @param pkg The package manifest.
     * @param state The verification state.
     * @param stack The traversal stack. A frame for the package is pushed onto it.
     */
    void enter(const manifest& pkg, verification_state& state, std::vector<frame>& stack) const;

    /**
     * Verify a single declared dependency.
     *
     * @param dep The dependency declaration.
     * @param directory The dependent's directory.
     * @return The dependency's manifest if its own dependencies need verification.
     */
    std::optional<manifest> verify_dependency(const dependency_declaration& dep, const fs::path& directory) const;

    /**
     * Verify a package and, transitively, its dependencies.
     *
     * @param pkg The package manifest.
     * @param state The verification state.
     */
    void verify_package(const manifest& pkg, verification_state& state) const;

public:
    /**
     * Construct a verifier.
     *
     * @param options The callbacks.
     * @param resolver The package directory resolver.
     */
    explicit verifier(verify_options options = {}, path_resolver resolver = path_resolver{});

    /**
     * Verify a package with fresh state.
     *
     * @param start The directory to resolve the package from.
     * @param name The package name.
     * @return The state after verification.
     */
    verification_state verify(const fs::path& start, const std::string& name) const;

    /**
     * Verify a package using caller-owned state. Directories already visited
     * in `state` are not verified again.
     *
     * @param start The directory to resolve the package from.
     * @param name The package name.
     * @param state The verification state.
     */
    void verify(const fs::path& start, const std::string& name, verification_state& state) const;
};

}    // namespace pkgverify
