/**
 * pkgverify - a package dependency verifier.
 *
 * semantic versions and version ranges.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <algorithm>

#include <fmt/core.h>

#include "semver.h"
#include "utils.h"

namespace pkgverify::semver
{

/*
 * Lexical helpers.
 */

/** Character class for pre-release and build identifiers. */
static bool is_identifier_char(char c)
{
    return utils::is_alnum(c) || c == '-';
}

/** Whether a string consists only of decimal digits. */
static bool is_numeric(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), utils::is_digit);
}

/** Whether a character is a wildcard component (`x`, `X` or `*`). */
static bool is_wildcard(char c)
{
    return c == 'x' || c == 'X' || c == '*';
}

/**
 * Parse a numeric identifier: `0` or a number without leading zeros.
 *
 * @param s The input.
 * @param pos Position to start at. Advanced past the number on success.
 * @return The number, or `std::nullopt` if no valid number starts at `pos`.
 */
static std::optional<std::uint64_t> parse_number(std::string_view s, std::size_t& pos)
{
    std::size_t end = pos;
    while(end < s.length() && utils::is_digit(s[end]))
    {
        ++end;
    }

    const std::size_t count = end - pos;
    if(count == 0 || (count > 1 && s[pos] == '0') || count > 16)
    {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    for(std::size_t i = pos; i < end; ++i)
    {
        value = value * 10 + static_cast<std::uint64_t>(s[i] - '0');
    }
    if(value > max_number)
    {
        return std::nullopt;
    }

    pos = end;
    return value;
}

/**
 * Parse dot-separated identifiers.
 *
 * @param s The input.
 * @param pos Position to start at. Advanced past the identifiers on success.
 * @param prerelease Whether numeric identifiers must not have leading zeros.
 * @return The identifiers, or `std::nullopt` if they are malformed.
 */
static std::optional<std::vector<std::string>> parse_identifiers(std::string_view s, std::size_t& pos, bool prerelease)
{
    std::size_t end = pos;
    while(end < s.length() && (is_identifier_char(s[end]) || s[end] == '.'))
    {
        ++end;
    }

    std::vector<std::string> ids = utils::split(std::string{s.substr(pos, end - pos)}, ".");
    if(ids.empty())
    {
        return std::nullopt;
    }

    for(const auto& id: ids)
    {
        if(id.empty())
        {
            return std::nullopt;
        }
        if(prerelease && is_numeric(id) && id.length() > 1 && id[0] == '0')
        {
            return std::nullopt;
        }
    }

    pos = end;
    return ids;
}

/**
 * Parse optional pre-release and build suffixes.
 *
 * @return Whether the suffixes (if present) were well-formed.
 */
static bool parse_suffixes(std::string_view s, std::size_t& pos, std::vector<std::string>& prerelease, std::vector<std::string>& build)
{
    if(pos < s.length() && s[pos] == '-')
    {
        ++pos;
        auto ids = parse_identifiers(s, pos, true);
        if(!ids)
        {
            return false;
        }
        prerelease = std::move(*ids);
    }

    if(pos < s.length() && s[pos] == '+')
    {
        ++pos;
        auto ids = parse_identifiers(s, pos, false);
        if(!ids)
        {
            return false;
        }
        build = std::move(*ids);
    }

    return true;
}

/*
 * version implementation.
 */

std::optional<version> version::parse(std::string_view s)
{
    if(s.length() > max_length)
    {
        return std::nullopt;
    }

    const std::string text = utils::trim(s);
    std::string_view sv{text};
    std::size_t pos = 0;

    if(pos < sv.length() && sv[pos] == 'v')
    {
        ++pos;
    }

    version v;

    auto major = parse_number(sv, pos);
    if(!major || pos >= sv.length() || sv[pos] != '.')
    {
        return std::nullopt;
    }
    ++pos;

    auto minor = parse_number(sv, pos);
    if(!minor || pos >= sv.length() || sv[pos] != '.')
    {
        return std::nullopt;
    }
    ++pos;

    auto patch = parse_number(sv, pos);
    if(!patch)
    {
        return std::nullopt;
    }

    v.major = *major;
    v.minor = *minor;
    v.patch = *patch;

    if(!parse_suffixes(sv, pos, v.prerelease, v.build) || pos != sv.length())
    {
        return std::nullopt;
    }

    return v;
}

std::string version::to_string() const
{
    std::string s = fmt::format("{}.{}.{}", major, minor, patch);
    if(!prerelease.empty())
    {
        s += "-" + utils::join(prerelease, ".");
    }
    if(!build.empty())
    {
        s += "+" + utils::join(build, ".");
    }
    return s;
}

/** Compare two pre-release identifiers. */
static int compare_identifiers(const std::string& a, const std::string& b)
{
    const bool a_num = is_numeric(a);
    const bool b_num = is_numeric(b);

    if(a_num && b_num)
    {
        // no leading zeros, so longer means larger.
        if(a.length() != b.length())
        {
            return a.length() < b.length() ? -1 : 1;
        }
        return a.compare(b) < 0 ? -1 : (a.compare(b) > 0 ? 1 : 0);
    }

    if(a_num)
    {
        return -1;
    }
    if(b_num)
    {
        return 1;
    }

    const int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int compare(const version& a, const version& b)
{
    if(a.major != b.major)
    {
        return a.major < b.major ? -1 : 1;
    }
    if(a.minor != b.minor)
    {
        return a.minor < b.minor ? -1 : 1;
    }
    if(a.patch != b.patch)
    {
        return a.patch < b.patch ? -1 : 1;
    }

    // a version without pre-release has higher precedence.
    if(a.prerelease.empty() || b.prerelease.empty())
    {
        if(a.prerelease.empty() && b.prerelease.empty())
        {
            return 0;
        }
        return a.prerelease.empty() ? 1 : -1;
    }

    const std::size_t n = std::min(a.prerelease.size(), b.prerelease.size());
    for(std::size_t i = 0; i < n; ++i)
    {
        const int c = compare_identifiers(a.prerelease[i], b.prerelease[i]);
        if(c != 0)
        {
            return c;
        }
    }

    if(a.prerelease.size() == b.prerelease.size())
    {
        return 0;
    }
    return a.prerelease.size() < b.prerelease.size() ? -1 : 1;
}

/*
 * comparator implementation.
 */

bool comparator::test(const version& v) const
{
    switch(kind)
    {
    case op::any: return true;
    case op::eq: return compare(v, operand) == 0;
    case op::lt: return compare(v, operand) < 0;
    case op::le: return compare(v, operand) <= 0;
    case op::gt: return compare(v, operand) > 0;
    case op::ge: return compare(v, operand) >= 0;
    }
    return false;
}

/*
 * range parsing.
 */

/** A possibly incomplete version as written in a range, e.g. `1.x` or `2`. */
struct partial
{
    std::optional<std::uint64_t> major;
    std::optional<std::uint64_t> minor;
    std::optional<std::uint64_t> patch;
    std::vector<std::string> prerelease;
};

/**
 * Parse one component of a partial version.
 *
 * @param s The input.
 * @param pos The position. Advanced past the component on success.
 * @param value Receives the number, or `std::nullopt` for a wildcard.
 * @return Whether a component was parsed.
 */
static bool parse_partial_component(std::string_view s, std::size_t& pos, std::optional<std::uint64_t>& value)
{
    if(pos < s.length() && is_wildcard(s[pos]))
    {
        ++pos;
        value = std::nullopt;
        return true;
    }

    auto n = parse_number(s, pos);
    if(!n)
    {
        return false;
    }
    value = n;
    return true;
}

/**
 * Parse a partial version. Leading `v`, `=` and whitespace are skipped.
 *
 * @param s The input.
 * @return The partial version, or `std::nullopt` if the input is malformed.
 */
static std::optional<partial> parse_partial(std::string_view s)
{
    std::size_t pos = 0;
    while(pos < s.length() && (s[pos] == 'v' || s[pos] == '=' || utils::is_space(s[pos])))
    {
        ++pos;
    }

    partial p;
    if(!parse_partial_component(s, pos, p.major))
    {
        return std::nullopt;
    }

    if(pos < s.length() && s[pos] == '.')
    {
        ++pos;
        if(!parse_partial_component(s, pos, p.minor))
        {
            return std::nullopt;
        }

        if(pos < s.length() && s[pos] == '.')
        {
            ++pos;
            if(!parse_partial_component(s, pos, p.patch))
            {
                return std::nullopt;
            }

            std::vector<std::string> build;
            if(!parse_suffixes(s, pos, p.prerelease, build))
            {
                return std::nullopt;
            }
        }
    }

    if(pos != s.length())
    {
        return std::nullopt;
    }

    // a wildcard makes all following components wildcards.
    if(!p.major)
    {
        p.minor = std::nullopt;
    }
    if(!p.minor)
    {
        p.patch = std::nullopt;
    }
    if(!p.patch)
    {
        p.prerelease.clear();
    }

    return p;
}

/** Create a version from its components. */
static version make_version(std::uint64_t major, std::uint64_t minor, std::uint64_t patch, std::vector<std::string> prerelease = {})
{
    version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    v.prerelease = std::move(prerelease);
    return v;
}

/** Upper bound that excludes all pre-releases of `v`, i.e. `v-0`. */
static version exclusive_bound(std::uint64_t major, std::uint64_t minor, std::uint64_t patch)
{
    return make_version(major, minor, patch, {"0"});
}

/** A comparator matching every version. */
static comparator any()
{
    return comparator{comparator::op::any, {}};
}

/** Desugar `~M.m.p`. */
static std::vector<comparator> desugar_tilde(const partial& p)
{
    using op = comparator::op;

    if(!p.major)
    {
        return {any()};
    }
    const std::uint64_t M = *p.major;

    if(!p.minor)
    {
        return {{op::ge, make_version(M, 0, 0)}, {op::lt, exclusive_bound(M + 1, 0, 0)}};
    }
    const std::uint64_t m = *p.minor;

    if(!p.patch)
    {
        return {{op::ge, make_version(M, m, 0)}, {op::lt, exclusive_bound(M, m + 1, 0)}};
    }

    return {{op::ge, make_version(M, m, *p.patch, p.prerelease)}, {op::lt, exclusive_bound(M, m + 1, 0)}};
}

/** Desugar `^M.m.p`: allow changes that do not modify the left-most non-zero component. */
static std::vector<comparator> desugar_caret(const partial& p)
{
    using op = comparator::op;

    if(!p.major)
    {
        return {any()};
    }
    const std::uint64_t M = *p.major;

    if(!p.minor)
    {
        return {{op::ge, make_version(M, 0, 0)}, {op::lt, exclusive_bound(M + 1, 0, 0)}};
    }
    const std::uint64_t m = *p.minor;

    if(!p.patch)
    {
        if(M == 0)
        {
            return {{op::ge, make_version(M, m, 0)}, {op::lt, exclusive_bound(M, m + 1, 0)}};
        }
        return {{op::ge, make_version(M, m, 0)}, {op::lt, exclusive_bound(M + 1, 0, 0)}};
    }
    const std::uint64_t patch = *p.patch;

    comparator lower{op::ge, make_version(M, m, patch, p.prerelease)};
    if(M == 0)
    {
        if(m == 0)
        {
            return {lower, {op::lt, exclusive_bound(M, m, patch + 1)}};
        }
        return {lower, {op::lt, exclusive_bound(M, m + 1, 0)}};
    }
    return {lower, {op::lt, exclusive_bound(M + 1, 0, 0)}};
}

/** Desugar a primitive or X-range comparator, e.g. `>=1.2.3`, `1.x`, `<2`. */
static std::vector<comparator> desugar_xrange(comparator::op kind, bool has_operator, const partial& p)
{
    using op = comparator::op;

    const bool x_major = !p.major;
    const bool x_minor = x_major || !p.minor;
    const bool x_patch = x_minor || !p.patch;

    if(kind == op::eq && x_patch)
    {
        has_operator = false;
    }

    if(x_major)
    {
        if(has_operator && (kind == op::gt || kind == op::lt))
        {
            // nothing is allowed.
            return {{op::lt, exclusive_bound(0, 0, 0)}};
        }
        return {any()};
    }

    std::uint64_t M = *p.major;
    std::uint64_t m = x_minor ? 0 : *p.minor;
    std::uint64_t patch = x_patch ? 0 : *p.patch;

    if(has_operator && x_patch)
    {
        if(kind == op::gt)
        {
            // >1 => >=2.0.0, >1.2 => >=1.3.0
            kind = op::ge;
            if(x_minor)
            {
                M += 1;
                m = 0;
            }
            else
            {
                m += 1;
            }
            patch = 0;
        }
        else if(kind == op::le)
        {
            // <=0.7.x => <0.8.0-0, <=1 => <2.0.0-0
            kind = op::lt;
            if(x_minor)
            {
                M += 1;
            }
            else
            {
                m += 1;
            }
        }

        if(kind == op::lt)
        {
            return {{kind, exclusive_bound(M, m, patch)}};
        }
        return {{kind, make_version(M, m, patch)}};
    }

    if(x_minor)
    {
        return {{op::ge, make_version(M, 0, 0)}, {op::lt, exclusive_bound(M + 1, 0, 0)}};
    }

    if(x_patch)
    {
        return {{op::ge, make_version(M, m, 0)}, {op::lt, exclusive_bound(M, m + 1, 0)}};
    }

    return {{has_operator ? kind : op::eq, make_version(M, m, patch, p.prerelease)}};
}

/** Desugar a hyphen range `A - B`. */
static std::optional<std::vector<comparator>> desugar_hyphen(std::string_view from_text, std::string_view to_text)
{
    using op = comparator::op;

    auto from = parse_partial(from_text);
    auto to = parse_partial(to_text);
    if(!from || !to)
    {
        return std::nullopt;
    }

    std::vector<comparator> result;

    if(from->major)
    {
        if(!from->minor)
        {
            result.push_back({op::ge, make_version(*from->major, 0, 0)});
        }
        else if(!from->patch)
        {
            result.push_back({op::ge, make_version(*from->major, *from->minor, 0)});
        }
        else
        {
            result.push_back({op::ge, make_version(*from->major, *from->minor, *from->patch, from->prerelease)});
        }
    }

    if(to->major)
    {
        if(!to->minor)
        {
            result.push_back({op::lt, exclusive_bound(*to->major + 1, 0, 0)});
        }
        else if(!to->patch)
        {
            result.push_back({op::lt, exclusive_bound(*to->major, *to->minor + 1, 0)});
        }
        else
        {
            result.push_back({op::le, make_version(*to->major, *to->minor, *to->patch, to->prerelease)});
        }
    }

    if(result.empty())
    {
        result.push_back(any());
    }
    return result;
}

/**
 * Parse and desugar a single comparator token.
 *
 * @param token The token, with its operator attached.
 * @return The equivalent primitive comparators, or `std::nullopt` if the token is malformed.
 */
static std::optional<std::vector<comparator>> parse_comparator(std::string_view token)
{
    using op = comparator::op;

    if(token.starts_with('^'))
    {
        auto p = parse_partial(token.substr(1));
        if(!p)
        {
            return std::nullopt;
        }
        return desugar_caret(*p);
    }

    if(token.starts_with('~'))
    {
        std::string_view rest = token.substr(1);
        if(rest.starts_with('>'))
        {
            rest.remove_prefix(1);
        }
        auto p = parse_partial(rest);
        if(!p)
        {
            return std::nullopt;
        }
        return desugar_tilde(*p);
    }

    op kind = op::eq;
    bool has_operator = true;
    if(token.starts_with(">="))
    {
        kind = op::ge;
        token.remove_prefix(2);
    }
    else if(token.starts_with("<="))
    {
        kind = op::le;
        token.remove_prefix(2);
    }
    else if(token.starts_with('>'))
    {
        kind = op::gt;
        token.remove_prefix(1);
    }
    else if(token.starts_with('<'))
    {
        kind = op::lt;
        token.remove_prefix(1);
    }
    else if(token.starts_with('='))
    {
        token.remove_prefix(1);
    }
    else
    {
        has_operator = false;
    }

    auto p = parse_partial(token);
    if(!p)
    {
        return std::nullopt;
    }
    return desugar_xrange(kind, has_operator, *p);
}

/** Whether a token consists only of operator characters, as in `>= 1.2.3`. */
static bool is_operator_token(const std::string& token)
{
    return std::all_of(
      token.begin(),
      token.end(),
      [](char c) -> bool
      {
          return c == '<' || c == '>' || c == '=' || c == '~' || c == '^';
      });
}

/**
 * Split a comparator set into tokens, attaching detached operators to their operand.
 */
static std::vector<std::string> tokenize(std::string_view s)
{
    std::vector<std::string> words;
    std::size_t pos = 0;
    while(pos < s.length())
    {
        while(pos < s.length() && utils::is_space(s[pos]))
        {
            ++pos;
        }
        std::size_t end = pos;
        while(end < s.length() && !utils::is_space(s[end]))
        {
            ++end;
        }
        if(end > pos)
        {
            words.emplace_back(s.substr(pos, end - pos));
        }
        pos = end;
    }

    std::vector<std::string> tokens;
    for(std::size_t i = 0; i < words.size(); ++i)
    {
        if(is_operator_token(words[i]) && i + 1 < words.size())
        {
            tokens.push_back(words[i] + words[i + 1]);
            ++i;
        }
        else
        {
            tokens.push_back(words[i]);
        }
    }
    return tokens;
}

/*
 * range implementation.
 */

std::optional<range> range::parse(std::string_view s)
{
    range r;

    for(const auto& alternative: utils::split(std::string{s}, "||"))
    {
        const std::vector<std::string> tokens = tokenize(alternative);
        std::vector<comparator> set;

        if(tokens.size() == 3 && tokens[1] == "-")
        {
            auto comparators = desugar_hyphen(tokens[0], tokens[2]);
            if(!comparators)
            {
                return std::nullopt;
            }
            set = std::move(*comparators);
        }
        else
        {
            for(const auto& token: tokens)
            {
                auto comparators = parse_comparator(token);
                if(!comparators)
                {
                    return std::nullopt;
                }
                set.insert(set.end(), comparators->begin(), comparators->end());
            }
        }

        if(set.empty())
        {
            set.push_back(any());
        }
        r.sets.push_back(std::move(set));
    }

    if(r.sets.empty())
    {
        r.sets.push_back({any()});
    }

    return r;
}

bool range::test_set(const std::vector<comparator>& set, const version& v)
{
    if(!std::all_of(
         set.begin(),
         set.end(),
         [&v](const comparator& c) -> bool
         {
             return c.test(v);
         }))
    {
        return false;
    }

    if(!v.is_prerelease())
    {
        return true;
    }

    return std::any_of(
      set.begin(),
      set.end(),
      [&v](const comparator& c) -> bool
      {
          return c.kind != comparator::op::any
                 && c.operand.is_prerelease()
                 && c.operand.same_release(v);
      });
}

bool range::test(const version& v) const
{
    return std::any_of(
      sets.begin(),
      sets.end(),
      [&v](const auto& set) -> bool
      {
          return test_set(set, v);
      });
}

/*
 * Contract functions.
 */

bool is_valid_version(std::string_view s)
{
    return version::parse(s).has_value();
}

bool satisfies(std::string_view v, std::string_view r)
{
    auto parsed_version = version::parse(v);
    if(!parsed_version)
    {
        return false;
    }

    auto parsed_range = range::parse(r);
    if(!parsed_range)
    {
        return false;
    }

    return parsed_range->test(*parsed_version);
}

}    // namespace pkgverify::semver
