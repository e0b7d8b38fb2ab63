#pragma once
///@file

#include "baseimg/libutil/mount.hh"
#include "baseimg/libutil/namespaces.hh"
#include "baseimg/libutil/types.hh"

#include <map>
#include <vector>

namespace baseimg {

/**
 * A bind mount to perform.
 */
struct MountSpec
{
    Path source;
    Path target;
    bool recursive = false;

    bool operator==(const MountSpec &) const = default;
};

/**
 * A top-level entry of the host's root directory.
 */
struct HostEntry
{
    enum class Type { Directory, Symlink, Other };

    std::string name;
    Type type;
    /**
     * Symlink target, for `Type::Symlink`.
     */
    Path linkTarget = "";
};

/**
 * What `composeStaging()` creates in the staging directory.
 */
struct StagingPlan
{
    Path stagingDir;
    /**
     * Name in the staging directory to link target.
     */
    std::map<std::string, Path> symlinks;
    /**
     * Empty directories to create, as mount points.
     */
    StringSet directories;
    /**
     * In the order they must be performed.
     */
    std::vector<MountSpec> mounts;
};

/**
 * List the entries of `hostRoot`.
 */
std::vector<HostEntry> listHostRoot(const Path & hostRoot);

/**
 * Plan a staging directory mirroring `hostRoot` except for the entry
 * named `exclude`: host symlinks are recreated, host directories are
 * bind-mounted onto empty directories and anything else is left out.
 * `storePath` is then bind-mounted, recursively, onto `exclude`.
 */
StagingPlan planStaging(
    const Path & hostRoot,
    const std::vector<HostEntry> & hostEntries,
    const std::string & exclude,
    const Path & storePath,
    const Path & stagingDir,
    bool recursiveHostBinds);

StagingPlan planStaging(
    const Path & hostRoot,
    const std::string & exclude,
    const Path & storePath,
    const Path & stagingDir,
    bool recursiveHostBinds);

/**
 * Create the symlinks, directories and mounts of `plan`. The mounts only
 * exist in the isolated mount namespace.
 */
void composeStaging(const IsolatedNamespace & ns, const StagingPlan & plan, const MountSyscall & syscall = ::mount);

/**
 * Remove a staging directory once nothing is mounted on it any more.
 * Only symlinks and empty directories are removed; a directory that is
 * not empty is an error, as it is still a mount of a host directory.
 */
void removeStagingTree(const Path & stagingDir);

/**
 * A staging directory that is removed with `removeStagingTree()` on
 * destruction.
 */
class StagingTree
{
    Path path_;

public:
    StagingTree();
    StagingTree(const StagingTree &) = delete;
    StagingTree & operator=(const StagingTree &) = delete;
    ~StagingTree();

    const Path & path() const { return path_; }
};

}
