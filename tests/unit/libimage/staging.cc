#include "baseimg/libimage/staging.hh"
#include "baseimg/libutil/file-system.hh"
#include "tests/host-entry.hh"
#include "tests/test-files.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <rapidcheck/gen/Arbitrary.h>
#include <rapidcheck/gen/Container.h>
#include <rapidcheck/gtest.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <cerrno>

using testing::ElementsAre;
using testing::Eq;
using testing::Pair;

namespace baseimg {

/* ----------------------------------------------------------------------------
 * planStaging
 * --------------------------------------------------------------------------*/

static std::vector<HostEntry> typicalHost()
{
    return {
        {"bin", HostEntry::Type::Symlink, "usr/bin"},
        {"etc", HostEntry::Type::Directory},
        {"lib", HostEntry::Type::Symlink, "usr/lib"},
        {"nix", HostEntry::Type::Directory},
        {"proc", HostEntry::Type::Directory},
        {"swapfile", HostEntry::Type::Other},
        {"usr", HostEntry::Type::Directory},
    };
}

TEST(planStaging, mirrorsHostRoot)
{
    auto plan = planStaging("/", typicalHost(), "nix", "/home/user/nix", "/tmp/root", true);

    ASSERT_EQ(plan.stagingDir, "/tmp/root");
    ASSERT_THAT(plan.symlinks, ElementsAre(Pair("bin", "usr/bin"), Pair("lib", "usr/lib")));
    ASSERT_THAT(plan.directories, Eq<StringSet>({"etc", "nix", "proc", "usr"}));
    ASSERT_THAT(plan.mounts, ElementsAre(
        MountSpec{"/etc", "/tmp/root/etc", true},
        MountSpec{"/proc", "/tmp/root/proc", true},
        MountSpec{"/usr", "/tmp/root/usr", true},
        MountSpec{"/home/user/nix", "/tmp/root/nix", true}));
}

TEST(planStaging, storeIsMountedLast)
{
    auto plan = planStaging("/", typicalHost(), "nix", "/home/user/nix", "/tmp/root", true);

    ASSERT_EQ(plan.mounts.back(), (MountSpec{"/home/user/nix", "/tmp/root/nix", true}));
}

TEST(planStaging, nonRecursiveHostBinds)
{
    auto plan = planStaging("/", typicalHost(), "nix", "/home/user/nix", "/tmp/root", false);

    for (auto & mount : plan.mounts)
        if (mount.target != "/tmp/root/nix")
            ASSERT_FALSE(mount.recursive) << mount.source;

    /* The store may have submounts of its own. */
    ASSERT_TRUE(plan.mounts.back().recursive);
}

TEST(planStaging, excludedSymlinkIsNotMirrored)
{
    std::vector<HostEntry> host{
        {"nix", HostEntry::Type::Symlink, "/var/nix"},
        {"var", HostEntry::Type::Directory},
    };

    auto plan = planStaging("/", host, "nix", "/home/user/nix", "/tmp/root", true);

    ASSERT_TRUE(plan.symlinks.empty());
    ASSERT_THAT(plan.directories, Eq<StringSet>({"nix", "var"}));
    ASSERT_THAT(plan.mounts, ElementsAre(
        MountSpec{"/var", "/tmp/root/var", true},
        MountSpec{"/home/user/nix", "/tmp/root/nix", true}));
}

TEST(planStaging, hostWithoutExcludedEntry)
{
    std::vector<HostEntry> host{{"usr", HostEntry::Type::Directory}};

    auto plan = planStaging("/", host, "nix", "/home/user/nix", "/tmp/root", true);

    ASSERT_THAT(plan.directories, Eq<StringSet>({"nix", "usr"}));
    ASSERT_EQ(plan.mounts.size(), 2);
}

TEST(planStaging, otherFilesAreLeftOut)
{
    std::vector<HostEntry> host{{"swapfile", HostEntry::Type::Other}};

    auto plan = planStaging("/", host, "nix", "/home/user/nix", "/tmp/root", true);

    ASSERT_TRUE(plan.symlinks.empty());
    ASSERT_THAT(plan.directories, Eq<StringSet>({"nix"}));
    ASSERT_EQ(plan.mounts.size(), 1);
}

TEST(planStaging, nonRootHost)
{
    std::vector<HostEntry> host{{"usr", HostEntry::Type::Directory}};

    auto plan = planStaging("/srv/host", host, "nix", "/home/user/nix", "/tmp/root", true);

    ASSERT_EQ(plan.mounts.front().source, "/srv/host/usr");
}

static std::vector<HostEntry> uniqueNames(std::vector<HostEntry> entries)
{
    std::vector<HostEntry> res;
    StringSet seen;
    for (auto & e : entries)
        if (seen.insert(e.name).second)
            res.push_back(std::move(e));
    return res;
}

RC_GTEST_PROP(planStaging, prop_excluded_entry_is_only_the_store, (std::vector<HostEntry> entries, EntryName exclude))
{
    auto host = uniqueNames(std::move(entries));
    auto plan = planStaging("/", host, exclude.name, "/home/user/nix", "/tmp/root", true);

    RC_ASSERT(!plan.symlinks.contains(exclude.name));

    size_t storeMounts = 0;
    for (auto & mount : plan.mounts)
        if (mount.target == "/tmp/root/" + exclude.name) {
            RC_ASSERT(mount.source == "/home/user/nix");
            storeMounts++;
        }
    RC_ASSERT(storeMounts == 1u);
    RC_ASSERT(plan.mounts.back().target == "/tmp/root/" + exclude.name);
    RC_ASSERT(plan.mounts.back().recursive);
}

RC_GTEST_PROP(planStaging, prop_every_host_directory_is_mounted_once, (std::vector<HostEntry> entries, bool recursive))
{
    auto host = uniqueNames(std::move(entries));
    auto plan = planStaging("/", host, "nix", "/home/user/nix", "/tmp/root", recursive);

    size_t directories = 0;
    for (auto & entry : host) {
        if (entry.name == "nix")
            continue;
        auto mounted = std::count_if(plan.mounts.begin(), plan.mounts.end(),
            [&](const MountSpec & m) { return m.source == "/" + entry.name; });
        if (entry.type == HostEntry::Type::Directory) {
            directories++;
            RC_ASSERT(mounted == 1);
            RC_ASSERT(plan.directories.contains(entry.name));
        } else
            RC_ASSERT(mounted == 0);
        RC_ASSERT(plan.symlinks.contains(entry.name) == (entry.type == HostEntry::Type::Symlink));
    }
    RC_ASSERT(plan.mounts.size() == directories + 1);
}

/* ----------------------------------------------------------------------------
 * listHostRoot
 * --------------------------------------------------------------------------*/

class HostRootTest : public TmpDirTest
{
protected:
    Path host;

    HostRootTest() : host(tmpDir + "/host")
    {
        createDirs(host + "/usr/bin");
        createDirs(host + "/etc");
        createDirs(host + "/nix/store");
        writeFileAt(host + "/etc/hostname", "builder\n");
        writeFileAt(host + "/swapfile");
        createSymlink("usr/bin", host + "/bin");
    }
};

TEST_F(HostRootTest, listsEntriesInNameOrder)
{
    auto entries = listHostRoot(host);

    std::vector<std::string> names;
    for (auto & e : entries)
        names.push_back(e.name);
    ASSERT_THAT(names, ElementsAre("bin", "etc", "nix", "swapfile", "usr"));

    ASSERT_EQ(entries[0].type, HostEntry::Type::Symlink);
    ASSERT_EQ(entries[0].linkTarget, "usr/bin");
    ASSERT_EQ(entries[1].type, HostEntry::Type::Directory);
    ASSERT_EQ(entries[3].type, HostEntry::Type::Other);
}

TEST_F(HostRootTest, plansFromFilesystem)
{
    auto plan = planStaging(host, "nix", tmpDir + "/store-root", tmpDir + "/staging", true);

    ASSERT_THAT(plan.symlinks, ElementsAre(Pair("bin", "usr/bin")));
    ASSERT_THAT(plan.mounts, ElementsAre(
        MountSpec{host + "/etc", tmpDir + "/staging/etc", true},
        MountSpec{host + "/usr", tmpDir + "/staging/usr", true},
        MountSpec{tmpDir + "/store-root", tmpDir + "/staging/nix", true}));
}

/* ----------------------------------------------------------------------------
 * composeStaging
 * --------------------------------------------------------------------------*/

class ComposeStagingTest : public HostRootTest
{
protected:
    Path storeRoot, staging;

    ComposeStagingTest()
        : storeRoot(tmpDir + "/store-root")
        , staging(tmpDir + "/staging")
    {
        writeFileAt(storeRoot + "/store/abc-nix/bin/nix", "#!/bin/sh\n", 0755);
        createDirs(staging);
    }

    void SetUp() override
    {
        if (!userNamespacesSupported())
            GTEST_SKIP() << "user namespaces are not available";
    }
};

TEST_F(ComposeStagingTest, composesBuildRoot)
{
    auto res = runInChild([&]() {
        auto ns = enterIsolatedNamespace();
        composeStaging(ns, planStaging(host, "nix", storeRoot, staging, true));

        if (readFile(staging + "/etc/hostname") != "builder\n")
            return 2;
        if (readLink(staging + "/bin") != "usr/bin")
            return 3;
        if (!pathExists(staging + "/nix/store/abc-nix/bin/nix"))
            return 4;
        if (pathExists(staging + "/swapfile"))
            return 5;
        return 0;
    });

    ASSERT_EQ(res, 0);

    /* Outside the namespace only the mount points are left. */
    ASSERT_THAT(readDirectory(staging + "/etc"), testing::IsEmpty());
    ASSERT_THAT(readDirectory(staging + "/nix"), testing::IsEmpty());
    ASSERT_EQ(readFile(host + "/etc/hostname"), "builder\n");

    removeStagingTree(staging);
    ASSERT_FALSE(pathExists(staging));
    ASSERT_TRUE(pathExists(host + "/etc/hostname"));
}

TEST_F(ComposeStagingTest, failedMountIsReported)
{
    auto res = runInChild([&]() {
        auto ns = enterIsolatedNamespace();
        auto plan = planStaging(host, "nix", storeRoot, staging, true);
        try {
            composeStaging(ns, plan, [](const char *, const char * target, const char *, unsigned long, const void *) {
                if (std::string_view(target).ends_with("/usr")) {
                    errno = EBUSY;
                    return -1;
                }
                return 0;
            });
        } catch (SysError & e) {
            return e.errNo == EBUSY ? 0 : 2;
        }
        return 3;
    });

    ASSERT_EQ(res, 0);
}

/* ----------------------------------------------------------------------------
 * removeStagingTree
 * --------------------------------------------------------------------------*/

class RemoveStagingTest : public TmpDirTest
{
protected:
    Path staging;

    RemoveStagingTest() : staging(tmpDir + "/staging")
    {
        createDirs(staging + "/usr");
        createDirs(staging + "/nix");
        createSymlink("usr/bin", staging + "/bin");
    }
};

TEST_F(RemoveStagingTest, removesMountPointsAndSymlinks)
{
    removeStagingTree(staging);

    ASSERT_FALSE(pathExists(staging));
}

TEST_F(RemoveStagingTest, neverRemovesContents)
{
    writeFileAt(staging + "/usr/precious", "host data");

    ASSERT_THROW(removeStagingTree(staging), SysError);
    ASSERT_EQ(readFile(staging + "/usr/precious"), "host data");
}

TEST_F(RemoveStagingTest, missingTreeIsNotAnError)
{
    ASSERT_NO_THROW(removeStagingTree(tmpDir + "/missing"));
}

TEST_F(TmpDirTest, stagingTreeIsPrivateAndTemporary)
{
    Path path;
    {
        StagingTree tree;
        path = tree.path();
        ASSERT_EQ(lstat(path).st_mode & 07777, 0700);
        ASSERT_EQ(std::string(baseNameOf(path)).rfind("base-img-root-", 0), 0);
        createDirs(path + "/usr");
    }
    ASSERT_FALSE(pathExists(path));
}

}
