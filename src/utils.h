/**
 * pkgverify - a package dependency verifier.
 *
 * utility functions.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pkgverify::utils
{

/** Returns if the given character is an alphabetic character. */
inline bool is_alpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/** Returns if the given character is one of the 10 decimal digits: `0123456789`. */
inline bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

/** Returns if the given character is an alphanumeric character. */
inline bool is_alnum(char c)
{
    return is_alpha(c) || is_digit(c);
}

/** Returns if the given character is a space, tab, or line break. */
inline bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/**
 * Split a string at a delimiter. Empty components are kept.
 *
 * @param s The string to split.
 * @param delimiter The delimiter that separates the string's components.
 * @return A vector of components of the original string.
 */
std::vector<std::string> split(const std::string& s, const std::string& delimiter);

/**
 * Join a vector of strings.
 *
 * @param v The vector of strings.
 * @param separator The seperator to use between the strings.
 * @return A string made of the vector's strings joined together and separated by the given separator.
 */
std::string join(const std::vector<std::string>& v, const std::string& separator);

/**
 * Remove leading and trailing whitespace.
 *
 * @param s The string to trim.
 * @return The trimmed string.
 */
std::string trim(std::string_view s);

}    // namespace pkgverify::utils
