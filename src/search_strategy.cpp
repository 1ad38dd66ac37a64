/**
 * pkgverify - a package dependency verifier.
 *
 * platform-dependent search path enumeration.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <algorithm>
#include <system_error>

#include "search_strategy.h"
#include "utils.h"

namespace pkgverify
{

/*
 * search_strategy implementation.
 */

std::vector<std::string> search_strategy::scan_ancestors(const std::string& from) const
{
    std::vector<std::string> paths;

    // `matched` counts the trailing characters of the current segment that
    // match `node_modules` from its end, and is -1 after a mismatch.
    const auto nm_length = static_cast<int>(modules_dir.length());
    std::size_t last = from.length();
    int matched = 0;

    for(std::size_t i = from.length(); i-- > 0;)
    {
        const char c = from[i];
        if(ends_segment(c))
        {
            if(matched != nm_length)
            {
                paths.push_back(join(from.substr(0, last), modules_dir));
            }
            last = i;
            matched = 0;
        }
        else if(matched != -1)
        {
            if(matched < nm_length
               && modules_dir[modules_dir.length() - 1 - static_cast<std::size_t>(matched)] == c)
            {
                ++matched;
            }
            else
            {
                matched = -1;
            }
        }
    }

    return paths;
}

std::string search_strategy::join(const std::string& base, const std::string& component) const
{
    std::string result = base;
    result += get_separator();
    result += component;
    return result;
}

std::vector<std::string> search_strategy::split_path_list(const std::string& list) const
{
    std::vector<std::string> parts = utils::split(list, std::string(1, get_delimiter()));
    std::erase_if(
      parts,
      [](const std::string& p) -> bool
      {
          return p.empty();
      });
    return parts;
}

bool search_strategy::is_path_request(const std::string& name) const
{
    return !name.empty() && (name[0] == '.' || name[0] == '/');
}

/*
 * posix_search_strategy implementation.
 */

/**
 * Make a path absolute and lexically normal.
 *
 * @param path The path.
 * @return The absolute path, or the unchanged input if the current directory is unavailable.
 */
static std::string posix_absolute(const std::string& path)
{
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if(ec)
    {
        return path;
    }
    return p.lexically_normal().string();
}

bool posix_search_strategy::ends_segment(char c) const
{
    return c == '/';
}

bool posix_search_strategy::is_root(const std::string& path) const
{
    return path == "/";
}

std::string posix_search_strategy::normalize(const std::string& path) const
{
    std::string result = path;
    while(result.length() > 1 && result.back() == '/')
    {
        result.pop_back();
    }
    return result;
}

std::vector<std::string> posix_search_strategy::node_modules_paths(const std::string& from) const
{
    const std::string dir = normalize(from);

    if(is_root(dir))
    {
        return {"/" + modules_dir};
    }

    std::vector<std::string> paths = scan_ancestors(dir);
    paths.push_back("/" + modules_dir);
    return paths;
}

std::vector<std::string> posix_search_strategy::global_paths(const environment& env) const
{
    std::vector<std::string> paths;

    if(env.node_path.has_value())
    {
        for(const auto& p: split_path_list(*env.node_path))
        {
            paths.push_back(normalize(posix_absolute(p)));
        }
    }

    if(env.home.has_value() && !env.home->empty())
    {
        const std::string home = normalize(posix_absolute(*env.home));
        paths.push_back(join(home, ".node_modules"));
        paths.push_back(join(home, ".node_libraries"));
    }

    if(!env.exec_path.empty())
    {
        const fs::path prefix = fs::path{posix_absolute(env.exec_path.string())}.parent_path().parent_path();
        paths.push_back(normalize((prefix / "lib" / "node").string()));
    }

    return paths;
}

/*
 * windows_search_strategy implementation.
 */

bool windows_search_strategy::ends_segment(char c) const
{
    return c == '\\' || c == '/' || c == ':';
}

std::string windows_search_strategy::parent(const std::string& path) const
{
    if(is_root(path))
    {
        return path;
    }

    const std::size_t pos = path.find_last_of("\\/");
    if(pos == std::string::npos)
    {
        return path;
    }

    // keep the separator of a drive root.
    if(pos > 0 && path[pos - 1] == ':')
    {
        return path.substr(0, pos + 1);
    }
    return path.substr(0, pos);
}

bool windows_search_strategy::is_root(const std::string& path) const
{
    return path.length() >= 2 && path[path.length() - 1] == '\\' && path[path.length() - 2] == ':';
}

std::string windows_search_strategy::normalize(const std::string& path) const
{
    std::string result = path;
    std::replace(result.begin(), result.end(), '/', '\\');
    while(result.length() > 1 && result.back() == '\\' && !is_root(result))
    {
        result.pop_back();
    }
    return result;
}

std::vector<std::string> windows_search_strategy::node_modules_paths(const std::string& from) const
{
    const std::string dir = normalize(from);

    if(is_root(dir))
    {
        return {dir + modules_dir};
    }

    return scan_ancestors(dir);
}

std::vector<std::string> windows_search_strategy::global_paths(const environment& env) const
{
    std::vector<std::string> paths;

    if(env.node_path.has_value())
    {
        for(const auto& p: split_path_list(*env.node_path))
        {
            paths.push_back(normalize(p));
        }
    }

    if(env.user_profile.has_value() && !env.user_profile->empty())
    {
        const std::string home = normalize(*env.user_profile);
        paths.push_back(join(home, ".node_modules"));
        paths.push_back(join(home, ".node_libraries"));
    }

    if(!env.exec_path.empty())
    {
        std::string prefix = parent(normalize(env.exec_path.string()));
        if(is_root(prefix))
        {
            prefix.pop_back();
        }
        paths.push_back(join(join(prefix, "lib"), "node"));
    }

    return paths;
}

/*
 * Strategy selection.
 */

std::shared_ptr<const search_strategy> make_search_strategy()
{
#ifdef _WIN32
    return std::make_shared<windows_search_strategy>();
#else
    return std::make_shared<posix_search_strategy>();
#endif
}

}    // namespace pkgverify
