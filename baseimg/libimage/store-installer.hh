#pragma once
///@file

#include "baseimg/libimage/closure.hh"
#include "baseimg/libutil/types.hh"

#include <optional>

#include <sys/stat.h>

namespace baseimg {

/**
 * Where everything lives below the directory the store is installed
 * into (`--path`, mounted as `/nix` inside the build).
 */
struct StoreLayout
{
    Path root;

    Path storeDir() const { return root + "/store"; }
    Path cacheDir() const { return root + "/.cache"; }
    Path confDir() const { return root + "/etc"; }
    Path stateDir() const { return root + "/var/nix"; }
    Path binLink() const { return root + "/.bin"; }
    Path closureFile() const { return cacheDir() + "/base_paths"; }

    /**
     * Whether a previous installation completed: the store, cache and
     * configuration directories all exist.
     */
    bool isInstalled() const;
};

struct InstallerOptions
{
    /**
     * Run as `program <scratch-dir>`.
     */
    Path program;

    /**
     * The store directory the installed package manager was built for,
     * as it appears in the install script, e.g. `/nix/store`.
     */
    Path storeDir;

    static InstallerOptions fromSettings();
};

extern const std::string defaultNixConf;

/**
 * Whether a top-level store entry was installed completely: it has no
 * write bits left, or it is a symlink.
 */
bool isCompleteStoreEntry(const struct stat & st);

/**
 * Find the first directory named `store` below `root`, looking at
 * shallower directories first and at siblings in name order. Symlinks
 * are not followed.
 */
std::optional<Path> findStoreDir(const Path & root);

/**
 * Extract the package manager's store path from the text of its
 * install script: the first line that starts with
 * `nix="<storeDir>/...`.
 *
 * @throws BadArtifact if there is no such line.
 */
Path parseInstallScript(std::string_view script, const Path & storeDir);

/**
 * Install the package manager's store into `layout.root`, unless a
 * previous call already did.
 *
 * The installer runs into a scratch directory; its store is copied into
 * `layout.storeDir()` with symlinks preserved, and every top-level store
 * entry is then made read-only. `etc/nix.conf` is only written if it
 * does not exist yet.
 *
 * @return the names of the top-level store entries, which are also
 * recorded in `layout.closureFile()`. An installed layout returns the
 * recorded closure without running anything or changing any file.
 */
Closure installStore(const StoreLayout & layout, const InstallerOptions & installer);

}
