#pragma once
///@file

#include <string>
#include <string_view>

namespace baseimg {

enum class StandardOutputStream {
    Stdout = 1,
    Stderr = 2,
};

/**
 * Determine whether ANSI escape sequences are appropriate for the
 * given output stream: `NO_COLOR` disables them, `CLICOLOR_FORCE`
 * forces them, and otherwise they are used on a real terminal.
 */
bool shouldANSI(StandardOutputStream fileno = StandardOutputStream::Stderr);

/**
 * Strip ANSI escape sequences from a string. Color sequences are kept
 * unless `filterAll` is set; every other sequence is always removed.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

}
