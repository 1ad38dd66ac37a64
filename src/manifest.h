/**
 * pkgverify - a package dependency verifier.
 *
 * package manifests.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace pkgverify
{

namespace fs = std::filesystem;

/** The dependency maps of a manifest, in verification order. */
enum class dependency_field
{
    dependencies,
    peer_dependencies,
    optional_dependencies
};

/** All dependency fields, in verification order. */
inline constexpr std::array<dependency_field, 3> dependency_fields = {
  dependency_field::dependencies,
  dependency_field::peer_dependencies,
  dependency_field::optional_dependencies};

/**
 * Get the manifest key of a dependency field.
 *
 * @param field The field.
 * @return The key, e.g. `peerDependencies`.
 */
std::string to_string(dependency_field field);

/** A dependency declared in a manifest. */
struct dependency_declaration
{
    /** The field the dependency was declared in. */
    dependency_field field;

    /** The dependency name. */
    std::string name;

    /** The version range. Empty if the declared value is not a string. */
    std::optional<std::string> range;
};

/** State of a dependency field. */
enum class field_state
{
    absent,  /** not present, or a false-like value. */
    invalid, /** present, but not a mapping. */
    present  /** a mapping. */
};

/** Reasons a manifest cannot be loaded. */
enum class read_error
{
    unreadable, /** the manifest file cannot be opened or read. */
    malformed   /** the contents are not a JSON object. */
};

class manifest;

/** Result of reading a manifest. */
using read_result = std::variant<manifest, read_error>;

/** A package manifest (`package.json`). */
class manifest
{
    /** The package directory. */
    fs::path directory;

    /** The decoded manifest. Always an object. */
    nlohmann::ordered_json data;

public:
    /** Manifest file name. */
    inline static const std::string filename = "package.json";

    /** Native build descriptor file name. */
    inline static const std::string binding_filename = "binding.gyp";

    /**
     * Construct a manifest.
     *
     * @param directory The package directory.
     * @param data The decoded manifest. Must be an object.
     * @throws std::invalid_argument if `data` is not an object.
     */
    manifest(fs::path directory, nlohmann::ordered_json data);

    /**
     * Read the manifest of a package directory.
     *
     * @param directory The package directory.
     * @return The manifest, or the reason it could not be read.
     */
    static read_result read(const fs::path& directory);

    /**
     * Check whether a package directory contains a native build descriptor.
     * Symbolic links are not followed.
     *
     * @param directory The package directory.
     */
    static bool has_native_binding(const fs::path& directory);

    /** Get the package name, if it is a string. */
    std::optional<std::string> get_name() const;

    /** Get the package version, if it is a string. */
    std::optional<std::string> get_version() const;

    /**
     * Get the state of a dependency field.
     *
     * @param field The dependency field.
     */
    field_state get_field_state(dependency_field field) const;

    /**
     * Get the dependencies declared in a field, in declaration order.
     *
     * @param field The dependency field.
     * @return The declarations. Empty unless the field state is `field_state::present`.
     */
    std::vector<dependency_declaration> get_dependencies(dependency_field field) const;

    /** Get the package directory. */
    const fs::path& get_directory() const
    {
        return directory;
    }
};

}    // namespace pkgverify
