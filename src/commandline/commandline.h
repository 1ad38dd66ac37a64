/**
 * pkgverify - a package dependency verifier.
 *
 * commands to be executed from the command line.
 *
 * \author Felix Lubbe
 * \copyright Copyright (c) 2025
 * \license Distributed under the MIT software license (see accompanying LICENSE.txt).
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "environment.h"
#include "resolver.h"

namespace pkgverify::commandline
{

namespace fs = std::filesystem;

/** A `pkg-verify` sub-command. */
class command
{
    /** Command name, as specified on the command line. */
    std::string name;

    /** Program name, used in help texts. */
    std::string program_name;

protected:
    /** The process environment, taken once at start-up. */
    const pkgverify::environment& env;

    /**
     * Create a `cxxopts::Options` object titled `<program> <command>`,
     * with a `-h,--help` option.
     *
     * @returns A `cxxopts::Options` object.
     */
    cxxopts::Options make_cxxopts_options() const;

    /**
     * Add the `-d,--directory` option, defaulting to the current directory.
     *
     * @param options The options to extend.
     * @param description The option's help text.
     */
    static void add_directory_option(cxxopts::Options& options, const std::string& description);

    /**
     * Get the directory given by `-d,--directory`.
     *
     * @param result The parse result.
     * @return The directory.
     */
    static fs::path get_directory(const cxxopts::ParseResult& result);

    /**
     * Parse the command's arguments.
     *
     * @param options A `cxxopts::Options` object.
     * @param args The arguments following the command name.
     * @return The parse result.
     */
    static cxxopts::ParseResult parse_args(cxxopts::Options& options, const std::vector<std::string>& args);

    /** Create a resolver for the current platform and environment. */
    path_resolver make_resolver() const;

public:
    /**
     * Construct a command.
     *
     * @param name The command's name, used for invocation.
     * @param program_name The program name.
     * @param env The process environment. Must outlive the command.
     */
    command(std::string name, std::string program_name, const pkgverify::environment& env);

    /** Destructor. */
    virtual ~command() = default;

    /**
     * Invoke the command.
     *
     * @param args Arguments for the command.
     * @throw Throws std::runtime_error.
     */
    virtual void invoke(const std::vector<std::string>& args) = 0;

    /** Get the command's description. */
    virtual std::string get_description() const = 0;

    /** Return the command's name. */
    const std::string& get_name() const
    {
        return name;
    }
};

/** Dependency tree verification. */
class verify : public command
{
public:
    /** Constructor. */
    verify(const std::string& program_name, const pkgverify::environment& env);
    void invoke(const std::vector<std::string>& args) override;
    std::string get_description() const override;
};

/** Package directory lookup. */
class resolve : public command
{
public:
    /** Constructor. */
    resolve(const std::string& program_name, const pkgverify::environment& env);
    void invoke(const std::vector<std::string>& args) override;
    std::string get_description() const override;
};

/** Search path listing. */
class paths : public command
{
public:
    /** Constructor. */
    paths(const std::string& program_name, const pkgverify::environment& env);
    void invoke(const std::vector<std::string>& args) override;
    std::string get_description() const override;
};

}    // namespace pkgverify::commandline
