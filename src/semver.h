/**
 * pkgverify - a package dependency verifier.
 *
 * semantic versions and version ranges.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pkgverify::semver
{

/** Maximum accepted length of a version string. */
constexpr std::size_t max_length = 256;

/** Largest accepted numeric identifier (2^53 - 1). */
constexpr std::uint64_t max_number = 9007199254740991;

/** A semantic version `major.minor.patch[-prerelease][+build]`. */
struct version
{
    /** Major version. */
    std::uint64_t major{0};

    /** Minor version. */
    std::uint64_t minor{0};

    /** Patch version. */
    std::uint64_t patch{0};

    /** Pre-release identifiers. */
    std::vector<std::string> prerelease;

    /** Build metadata identifiers. Ignored for comparisons. */
    std::vector<std::string> build;

    /**
     * Parse a version. Surrounding whitespace and a single leading `v` are accepted.
     *
     * @param s The version string.
     * @return The version, or `std::nullopt` if the string is not a valid semantic version.
     */
    static std::optional<version> parse(std::string_view s);

    /** Whether the version has pre-release identifiers. */
    bool is_prerelease() const
    {
        return !prerelease.empty();
    }

    /** Whether `major.minor.patch` of both versions agree. */
    bool same_release(const version& other) const
    {
        return major == other.major && minor == other.minor && patch == other.patch;
    }

    /** Format the version. */
    std::string to_string() const;
};

/**
 * Compare two versions by precedence.
 *
 * @return A negative value, zero, or a positive value if `a` is smaller, equal, or larger than `b`.
 */
int compare(const version& a, const version& b);

inline bool operator==(const version& a, const version& b)
{
    return compare(a, b) == 0;
}

inline bool operator<(const version& a, const version& b)
{
    return compare(a, b) < 0;
}

/** A single version comparison. */
struct comparator
{
    /** Comparison operators. `any` matches every version. */
    enum class op
    {
        any,
        eq,
        lt,
        le,
        gt,
        ge
    };

    /** The operator. */
    op kind{op::any};

    /** The version to compare against. Unused for `op::any`. */
    version operand;

    /** Test a version against this comparator. */
    bool test(const version& v) const;
};

/**
 * A version range: a disjunction of comparator sets, each set being a
 * conjunction of comparators.
 */
class range
{
    /** The comparator sets. */
    std::vector<std::vector<comparator>> sets;

    /**
     * Test a version against one comparator set.
     *
     * A pre-release version only matches if the set contains a pre-release
     * comparator on the same `major.minor.patch`.
     */
    static bool test_set(const std::vector<comparator>& set, const version& v);

public:
    /**
     * Parse a range expression, e.g. `^1.2.3`, `>=1.0.0 <2.0.0 || 3.x`, `1.0.0 - 1.4`.
     *
     * @param s The range expression.
     * @return The range, or `std::nullopt` if the expression is invalid.
     */
    static std::optional<range> parse(std::string_view s);

    /** Test whether a version lies in the range. */
    bool test(const version& v) const;

    /** Get the comparator sets. */
    const std::vector<std::vector<comparator>>& get_sets() const
    {
        return sets;
    }
};

/**
 * Check whether a string is a valid semantic version.
 *
 * @param s The version string.
 */
bool is_valid_version(std::string_view s);

/**
 * Check whether a version satisfies a range expression.
 *
 * @param v The version string.
 * @param r The range expression.
 * @return Whether `v` satisfies `r`. Returns `false` if either is invalid.
 */
bool satisfies(std::string_view v, std::string_view r);

}    // namespace pkgverify::semver
