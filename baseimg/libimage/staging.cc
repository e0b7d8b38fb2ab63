#include "baseimg/libimage/staging.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/logging.hh"

#include <algorithm>

namespace baseimg {

static Path childOf(const Path & dir, const std::string & name)
{
    return dir == "/" ? "/" + name : dir + "/" + name;
}

std::vector<HostEntry> listHostRoot(const Path & hostRoot)
{
    std::vector<HostEntry> entries;

    for (auto & entry : readDirectory(hostRoot)) {
        auto path = childOf(hostRoot, entry.name);
        auto st = maybeLstat(path);
        if (!st) {
            debug("'%s' disappeared while listing '%s'", path, hostRoot);
            continue;
        }
        if (S_ISLNK(st->st_mode))
            entries.push_back({entry.name, HostEntry::Type::Symlink, readLink(path)});
        else if (S_ISDIR(st->st_mode))
            entries.push_back({entry.name, HostEntry::Type::Directory});
        else
            entries.push_back({entry.name, HostEntry::Type::Other});
    }

    std::sort(entries.begin(), entries.end(),
        [](const HostEntry & a, const HostEntry & b) { return a.name < b.name; });

    return entries;
}

StagingPlan planStaging(
    const Path & hostRoot,
    const std::vector<HostEntry> & hostEntries,
    const std::string & exclude,
    const Path & storePath,
    const Path & stagingDir,
    bool recursiveHostBinds)
{
    StagingPlan plan{.stagingDir = stagingDir};

    for (auto & entry : hostEntries) {
        if (entry.name == exclude)
            continue;

        switch (entry.type) {
        case HostEntry::Type::Symlink:
            plan.symlinks.emplace(entry.name, entry.linkTarget);
            break;
        case HostEntry::Type::Directory:
            plan.directories.insert(entry.name);
            plan.mounts.push_back({
                .source = childOf(hostRoot, entry.name),
                .target = childOf(stagingDir, entry.name),
                .recursive = recursiveHostBinds,
            });
            break;
        case HostEntry::Type::Other:
            debug("not mirroring '%s', which is neither a directory nor a symlink", childOf(hostRoot, entry.name));
            break;
        }
    }

    plan.directories.insert(exclude);
    plan.mounts.push_back({
        .source = storePath,
        .target = childOf(stagingDir, exclude),
        .recursive = true,
    });

    return plan;
}

StagingPlan planStaging(
    const Path & hostRoot,
    const std::string & exclude,
    const Path & storePath,
    const Path & stagingDir,
    bool recursiveHostBinds)
{
    return planStaging(hostRoot, listHostRoot(hostRoot), exclude, storePath, stagingDir, recursiveHostBinds);
}

void composeStaging(const IsolatedNamespace & ns, const StagingPlan & plan, const MountSyscall & syscall)
{
    printInfo("composing the build root in '%s'", plan.stagingDir);
    debug("mounting as uid %d, gid %d", ns.uid(), ns.gid());

    for (auto & [name, target] : plan.symlinks) {
        debug("symlinking '%s' to '%s'", name, target);
        createSymlink(target, childOf(plan.stagingDir, name));
    }

    for (auto & name : plan.directories)
        createDirs(childOf(plan.stagingDir, name));

    for (auto & mount : plan.mounts)
        bindMount(mount.source, mount.target, mount.recursive, syscall);
}

void removeStagingTree(const Path & stagingDir)
{
    if (!maybeLstat(stagingDir))
        return;

    for (auto & entry : readDirectory(stagingDir)) {
        auto path = stagingDir + "/" + entry.name;
        auto st = lstat(path);
        if (S_ISDIR(st.st_mode)) {
            if (rmdir(path.c_str()) == -1)
                throw SysError("removing staging directory '%1%'", path);
        } else if (unlink(path.c_str()) == -1)
            throw SysError("removing '%1%'", path);
    }

    if (rmdir(stagingDir.c_str()) == -1)
        throw SysError("removing staging directory '%1%'", stagingDir);
}

StagingTree::StagingTree()
    : path_(createTempDir(defaultTempDir(), "base-img-root", true, true, 0700))
{
}

StagingTree::~StagingTree()
{
    try {
        removeStagingTree(path_);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

}
