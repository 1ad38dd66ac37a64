/**
 * pkgverify - a package dependency verifier.
 *
 * package manifests.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include "manifest.h"

namespace pkgverify
{

std::string to_string(dependency_field field)
{
    switch(field)
    {
    case dependency_field::dependencies: return "dependencies";
    case dependency_field::peer_dependencies: return "peerDependencies";
    case dependency_field::optional_dependencies: return "optionalDependencies";
    }

    throw std::invalid_argument(fmt::format("Invalid dependency field {}.", static_cast<int>(field)));
}

/** Whether a JSON value counts as "not set": `null`, `false`, `0` or `""`. */
static bool is_unset(const nlohmann::ordered_json& value)
{
    if(value.is_null())
    {
        return true;
    }
    if(value.is_boolean())
    {
        return !value.get<bool>();
    }
    if(value.is_number())
    {
        return value.get<double>() == 0.0;
    }
    if(value.is_string())
    {
        return value.get_ref<const std::string&>().empty();
    }
    return false;
}

/*
 * manifest implementation.
 */

manifest::manifest(fs::path directory, nlohmann::ordered_json data)
: directory{std::move(directory)}
, data{std::move(data)}
{
    if(!this->data.is_object())
    {
        throw std::invalid_argument(fmt::format("Manifest for '{}' is not an object.", this->directory.string()));
    }
}

read_result manifest::read(const fs::path& directory)
{
    const fs::path path = directory / filename;

    std::error_code ec;
    if(!fs::is_regular_file(path, ec))
    {
        return read_error::unreadable;
    }

    std::ifstream file{path, std::ios::in | std::ios::binary};
    if(!file)
    {
        return read_error::unreadable;
    }

    std::string text{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    if(file.bad())
    {
        return read_error::unreadable;
    }

    // parse without exceptions; a parse error yields a discarded value.
    nlohmann::ordered_json document = nlohmann::ordered_json::parse(text, nullptr, false);
    if(document.is_discarded() || !document.is_object())
    {
        return read_error::malformed;
    }

    return manifest{directory, std::move(document)};
}

bool manifest::has_native_binding(const fs::path& directory)
{
    std::error_code ec;
    const fs::file_status status = fs::symlink_status(directory / binding_filename, ec);
    if(ec)
    {
        return false;
    }
    return fs::is_regular_file(status);
}

std::optional<std::string> manifest::get_name() const
{
    auto it = data.find("name");
    if(it == data.end() || !it->is_string())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::string> manifest::get_version() const
{
    auto it = data.find("version");
    if(it == data.end() || !it->is_string())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

field_state manifest::get_field_state(dependency_field field) const
{
    auto it = data.find(to_string(field));
    if(it == data.end() || is_unset(*it))
    {
        return field_state::absent;
    }
    if(!it->is_object())
    {
        return field_state::invalid;
    }
    return field_state::present;
}

std::vector<dependency_declaration> manifest::get_dependencies(dependency_field field) const
{
    if(get_field_state(field) != field_state::present)
    {
        return {};
    }

    const auto& deps = data.at(to_string(field));

    std::vector<dependency_declaration> result;
    result.reserve(deps.size());
    for(const auto& [name, value]: deps.items())
    {
        std::optional<std::string> range;
        if(value.is_string())
        {
            range = value.get<std::string>();
        }
        result.push_back({field, name, std::move(range)});
    }
    return result;
}

}    // namespace pkgverify
