#pragma once
///@file

#include "baseimg/libutil/types.hh"

#include <optional>

namespace baseimg {

/**
 * @return the current user's home directory: `$HOME` if it exists and
 * belongs to the user, otherwise the one in the password database.
 */
std::optional<Path> tryGetHome();

/**
 * Like `tryGetHome()`, but throws if there is no home directory.
 */
Path getHome();

/**
 * @return $XDG_CONFIG_HOME if set and not empty, otherwise $HOME/.config.
 */
Path getConfigDir();

}
