#pragma once
///@file

#include "baseimg/libutil/types.hh"

#include <functional>

namespace baseimg {

int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * Load the configuration files, start the signal handler thread and set
 * the umask. Must be called before any other thread is started.
 */
void initBaseImg();

/**
 * Parse the command line. Flags shared by every program (`--verbose`,
 * `--quiet`, `--debug`, `--show-trace`, `--option NAME VALUE`) are
 * handled here; everything else is passed to `parseArg`, which returns
 * false for arguments it does not know.
 */
void parseCmdLine(
    const Strings & args,
    std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg);

/**
 * @return the argument following the flag `opt`, advancing `i` to it.
 */
std::string getArg(const std::string & opt,
    Strings::iterator & i, const Strings::iterator & end);

[[noreturn]]
void printVersion(const std::string & programName);

}
