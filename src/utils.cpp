/**
 * pkgverify - a package dependency verifier.
 *
 * utility functions.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <string>
#include <vector>

#include "utils.h"

namespace pkgverify::utils
{

std::vector<std::string> split(const std::string& s, const std::string& delimiter)
{
    if(s.empty())
    {
        return {};
    }

    if(delimiter.empty())
    {
        return {s};
    }

    // split s at <delimiter> occurences.
    std::vector<std::string> components;
    std::size_t current = 0;
    std::size_t last = 0;
    while((current = s.find(delimiter, last)) != std::string::npos)
    {
        components.push_back(s.substr(last, current - last));
        last = current + delimiter.length();
    }
    components.push_back(s.substr(last));

    return components;
}

std::string join(const std::vector<std::string>& v, const std::string& separator)
{
    if(v.empty())
    {
        return {};
    }

    if(v.size() == 1)
    {
        return v[0];
    }

    std::string res = v[0];
    for(auto it = std::next(v.begin()); it != v.end(); ++it)
    {
        res.append(separator);
        res.append(*it);
    }
    return res;
}

std::string trim(std::string_view s)
{
    std::size_t begin = 0;
    while(begin < s.length() && is_space(s[begin]))
    {
        ++begin;
    }

    std::size_t end = s.length();
    while(end > begin && is_space(s[end - 1]))
    {
        --end;
    }

    return std::string{s.substr(begin, end - begin)};
}

}    // namespace pkgverify::utils
