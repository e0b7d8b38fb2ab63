#pragma once
///@file

#include "baseimg/libutil/config.hh"
#include "baseimg/libutil/types.hh"

namespace baseimg {

class ImageSettings : public Config
{
public:
    ImageSettings();

    /**
     * The configuration file read before the user's. `BASEIMG_CONF_FILE`
     * overrides the built-in location.
     */
    Path systemConfFile;

    PathSetting installer{this, false, BASEIMG_DATA_DIR "/dl-nix.sh", "installer",
        R"(
          Program that downloads and unpacks the package manager. It is
          run with a scratch directory as its only argument and must leave
          a directory named `store` and a sibling `install` script below it.
        )"};

    PathSetting buildDescription{this, false, BASEIMG_DATA_DIR "/debug-shell", "build-description",
        R"(
          Directory holding the flake built into the image. The path is
          resolved inside the build's chroot, which mirrors the host.
        )"};

    Setting<std::string> buildProgram{this, "nix", "build-program",
        "Program run as `<build-program> build <build-description>` inside the chroot."};

    Setting<std::string> queryProgram{this, "nix-store", "query-program",
        "Program run as `<query-program> -qR <result>` to list the build's dependencies."};

    Setting<std::string> buildPath{this, "/nix/.bin:/usr/local/bin:/usr/bin:/bin", "build-path",
        "The only `PATH` the build and query programs see."};

    Setting<std::string> storeMountPoint{this, "nix", "store-mount-point",
        R"(
          Name of the top-level directory the installed store is mounted
          on inside the chroot. The host's directory of that name is not
          mirrored.
        )"};

    Setting<std::string> output{this, "base.tar.xz", "output",
        "Where to write the image, relative to the directory base-img was started in."};

    Setting<std::string> compression{this, "xz", "compression",
        "libarchive compression filter for the image (`xz`, `gzip`, `zstd`, ..., or `none`)."};

    Setting<unsigned int> compressionThreads{this, 0, "compression-threads",
        "Number of compressor threads; 0 uses one per core."};

    Setting<bool> recursiveHostBinds{this, true, "recursive-host-binds",
        R"(
          Bind-mount host directories into the chroot together with the
          mounts below them. Without this, a host directory with submounts
          that are locked to an outer user namespace cannot be mirrored.
        )"};

    /**
     * Store directory as seen from inside the chroot, e.g. `/nix/store`.
     */
    Path storeDir() const;

    /**
     * `NIX_CONF_DIR` for the build, e.g. `/nix/etc`.
     */
    Path confDir() const;
};

extern ImageSettings settings;

/**
 * Apply the system configuration file, then the user's
 * (`$XDG_CONFIG_HOME/base-img/base-img.conf`).
 */
void loadConfFile();

}
