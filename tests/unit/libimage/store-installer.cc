#include "baseimg/libimage/store-installer.hh"
#include "baseimg/libutil/environment-variables.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/processes.hh"
#include "baseimg/libutil/strings.hh"
#include "tests/test-files.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdlib>
#include <sys/wait.h>

using testing::Eq;
using testing::IsEmpty;

namespace baseimg {

/* ----------------------------------------------------------------------------
 * parseInstallScript
 * --------------------------------------------------------------------------*/

TEST(parseInstallScript, findsStorePath)
{
    auto script =
        "#!/bin/sh\n"
        "dest=\"/nix\"\n"
        "nix=\"/nix/store/abc-nix-2.24.9\"\n"
        "cacert=\"/nix/store/def-nss-cacert\"\n";

    ASSERT_EQ(parseInstallScript(script, "/nix/store"), "/nix/store/abc-nix-2.24.9");
}

TEST(parseInstallScript, usesFirstMatchingLine)
{
    auto script =
        "nix=\"/nix/store/first\"\n"
        "nix=\"/nix/store/second\"\n";

    ASSERT_EQ(parseInstallScript(script, "/nix/store"), "/nix/store/first");
}

TEST(parseInstallScript, lineMustStartWithAssignment)
{
    auto script = "  nix=\"/nix/store/indented\"\necho nix=\"/nix/store/echoed\"\n";

    ASSERT_THROW(parseInstallScript(script, "/nix/store"), BadArtifact);
}

TEST(parseInstallScript, storeDirMustMatch)
{
    ASSERT_THROW(parseInstallScript("nix=\"/gnu/store/abc-nix\"\n", "/nix/store"), BadArtifact);
    ASSERT_EQ(parseInstallScript("nix=\"/gnu/store/abc-nix\"\n", "/gnu/store"), "/gnu/store/abc-nix");
}

TEST(parseInstallScript, storeDirIsNotARegex)
{
    ASSERT_THROW(parseInstallScript("nix=\"/nixXstore/abc-nix\"\n", "/nix.store"), BadArtifact);
}

TEST(parseInstallScript, pathEndsAtClosingQuote)
{
    auto script = "nix=\"/nix/store/abc-nix-2.24.9\" # pinned\n";

    ASSERT_EQ(parseInstallScript(script, "/nix/store"), "/nix/store/abc-nix-2.24.9");
}

TEST(parseInstallScript, missingStoreDirIsNamed)
{
    try {
        parseInstallScript("nix=\"/gnu/store/x\"\n", "/nix/store");
        FAIL() << "parseInstallScript should have thrown";
    } catch (BadArtifact & e) {
        ASSERT_THAT(e.msg(), testing::HasSubstr("could not detect store path"));
    }
}

TEST(parseInstallScript, emptyScript)
{
    ASSERT_THROW(parseInstallScript("", "/nix/store"), BadArtifact);
}

/* ----------------------------------------------------------------------------
 * findStoreDir
 * --------------------------------------------------------------------------*/

class FindStoreDirTest : public TmpDirTest
{
};

TEST_F(FindStoreDirTest, findsNestedStore)
{
    createDirs(tmpDir + "/unpack/nix-2.24.9-x86_64-linux/store/abc-nix");

    ASSERT_EQ(findStoreDir(tmpDir), tmpDir + "/unpack/nix-2.24.9-x86_64-linux/store");
}

TEST_F(FindStoreDirTest, prefersShallowerStores)
{
    createDirs(tmpDir + "/a/b/store");
    createDirs(tmpDir + "/z/store");

    ASSERT_EQ(findStoreDir(tmpDir), tmpDir + "/z/store");
}

TEST_F(FindStoreDirTest, siblingsInNameOrder)
{
    createDirs(tmpDir + "/b/store");
    createDirs(tmpDir + "/a/store");

    ASSERT_EQ(findStoreDir(tmpDir), tmpDir + "/a/store");
}

TEST_F(FindStoreDirTest, ignoresFilesAndSymlinks)
{
    writeFileAt(tmpDir + "/a/store");
    createDirs(tmpDir + "/elsewhere/store");
    createSymlink(tmpDir + "/elsewhere", tmpDir + "/b");

    ASSERT_EQ(findStoreDir(tmpDir), tmpDir + "/elsewhere/store");
}

TEST_F(FindStoreDirTest, noStore)
{
    createDirs(tmpDir + "/a/b/c");

    ASSERT_EQ(findStoreDir(tmpDir), std::nullopt);
}

/* ----------------------------------------------------------------------------
 * installStore
 * --------------------------------------------------------------------------*/

class InstallStoreTest : public TmpDirTest
{
protected:
    StoreLayout layout;
    Path runLog;
    std::optional<std::string> savedTmpDir;

    InstallStoreTest()
        : layout{.root = tmpDir + "/nix"}
        , runLog(tmpDir + "/runs")
        , savedTmpDir(getEnv("TMPDIR"))
    {
        /* Scratch directories go below tmpDir so leftovers are visible. */
        createDirs(tmpDir + "/tmp");
        setenv("TMPDIR", (tmpDir + "/tmp").c_str(), 1);
    }

    ~InstallStoreTest()
    {
        if (savedTmpDir)
            setenv("TMPDIR", savedTmpDir->c_str(), 1);
        else
            unsetenv("TMPDIR");
    }

    InstallerOptions installer(const std::string & body)
    {
        return {
            .program = writeScript(tmpDir, "installer", "set -e\necho run >> '" + runLog + "'\n" + body),
            .storeDir = "/nix/store",
        };
    }

    /**
     * An installer that unpacks a two-entry store the way the release
     * tarball is laid out.
     */
    InstallerOptions goodInstaller()
    {
        return installer(
            "d=\"$1/unpack/nix-2.24.9-x86_64-linux\"\n"
            "mkdir -p \"$d/store/abc-nix-2.24.9/bin\" \"$d/store/def-openssl/lib\"\n"
            "echo '#!/bin/sh' > \"$d/store/abc-nix-2.24.9/bin/nix\"\n"
            "chmod 755 \"$d/store/abc-nix-2.24.9/bin/nix\"\n"
            "ln -s ../lib \"$d/store/def-openssl/libdir\"\n"
            "printf '#!/bin/sh\\nnix=\"/nix/store/abc-nix-2.24.9\"\\n' > \"$d/install\"\n");
    }

    size_t runs()
    {
        if (!pathExists(runLog))
            return 0;
        return tokenizeString<Strings>(readFile(runLog), "\n").size();
    }
};

TEST_F(InstallStoreTest, installsStore)
{
    auto closure = installStore(layout, goodInstaller());

    ASSERT_THAT(closure, Eq<Closure>({"abc-nix-2.24.9", "def-openssl"}));
    ASSERT_TRUE(layout.isInstalled());
    ASSERT_EQ(readFile(layout.storeDir() + "/abc-nix-2.24.9/bin/nix"), "#!/bin/sh\n");
    ASSERT_EQ(readFile(layout.closureFile()), "abc-nix-2.24.9\ndef-openssl\n");
    ASSERT_TRUE(pathExists(layout.stateDir()));
}

TEST_F(InstallStoreTest, linksBinDirectory)
{
    installStore(layout, goodInstaller());

    ASSERT_TRUE(isLink(layout.binLink()));
    ASSERT_EQ(readLink(layout.binLink()), "/nix/store/abc-nix-2.24.9/bin");
}

TEST_F(InstallStoreTest, writesDefaultConfiguration)
{
    installStore(layout, goodInstaller());

    ASSERT_EQ(readFile(layout.confDir() + "/nix.conf"), defaultNixConf);
}

TEST_F(InstallStoreTest, keepsExistingConfiguration)
{
    writeFileAt(layout.confDir() + "/nix.conf", "sandbox = true\n");

    installStore(layout, goodInstaller());

    ASSERT_EQ(readFile(layout.confDir() + "/nix.conf"), "sandbox = true\n");
}

TEST_F(InstallStoreTest, storeEntriesAreReadOnly)
{
    installStore(layout, goodInstaller());

    for (auto path : {"/abc-nix-2.24.9", "/abc-nix-2.24.9/bin", "/abc-nix-2.24.9/bin/nix", "/def-openssl/lib"})
        ASSERT_EQ(lstat(layout.storeDir() + path).st_mode & (S_IWUSR | S_IWGRP | S_IWOTH), 0) << path;

    ASSERT_EQ(lstat(layout.storeDir() + "/abc-nix-2.24.9/bin/nix").st_mode & 0555, 0555);
}

TEST_F(InstallStoreTest, preservesSymlinks)
{
    installStore(layout, goodInstaller());

    ASSERT_TRUE(isLink(layout.storeDir() + "/def-openssl/libdir"));
    ASSERT_EQ(readLink(layout.storeDir() + "/def-openssl/libdir"), "../lib");
}

TEST_F(InstallStoreTest, secondCallDoesNothing)
{
    auto first = installStore(layout, goodInstaller());
    auto confBefore = readFile(layout.confDir() + "/nix.conf");

    auto second = installStore(layout, goodInstaller());

    ASSERT_EQ(first, second);
    ASSERT_EQ(runs(), 1);
    ASSERT_EQ(readFile(layout.confDir() + "/nix.conf"), confBefore);
}

TEST_F(InstallStoreTest, installedLayoutReturnsRecordedClosure)
{
    createDirs(layout.storeDir());
    createDirs(layout.confDir());
    createDirs(layout.cacheDir());
    writeClosureFile(layout.closureFile(), {"recorded-entry"});

    auto closure = installStore(layout, installer("exit 1\n"));

    ASSERT_THAT(closure, Eq<Closure>({"recorded-entry"}));
    ASSERT_EQ(runs(), 0);
}

TEST_F(InstallStoreTest, resumesInterruptedInstallation)
{
    writeFileAt(layout.storeDir() + "/abc-nix-2.24.9/bin/nix", "from the first attempt");
    makeReadOnly(layout.storeDir() + "/abc-nix-2.24.9");

    auto closure = installStore(layout, goodInstaller());

    ASSERT_THAT(closure, Eq<Closure>({"abc-nix-2.24.9", "def-openssl"}));
    ASSERT_EQ(readFile(layout.storeDir() + "/abc-nix-2.24.9/bin/nix"), "from the first attempt");
    ASSERT_TRUE(layout.isInstalled());
}

TEST_F(InstallStoreTest, recopiesPartialEntries)
{
    /* Left by an installation interrupted while copying the entry. */
    createDirs(layout.storeDir() + "/abc-nix-2.24.9/bin");
    chmodPath(layout.storeDir() + "/abc-nix-2.24.9", 0700);

    auto closure = installStore(layout, goodInstaller());

    ASSERT_THAT(closure, Eq<Closure>({"abc-nix-2.24.9", "def-openssl"}));
    ASSERT_EQ(readFile(layout.storeDir() + "/abc-nix-2.24.9/bin/nix"), "#!/bin/sh\n");
    ASSERT_EQ(lstat(layout.storeDir() + "/abc-nix-2.24.9").st_mode & S_IWUSR, 0);
}

TEST_F(InstallStoreTest, recopiesPartialEntriesBelowReadOnlyDirectories)
{
    writeFileAt(layout.storeDir() + "/def-openssl/lib/libssl.so.part", "trunc");
    makeReadOnly(layout.storeDir() + "/def-openssl/lib");

    installStore(layout, goodInstaller());

    ASSERT_THAT(readDirectory(layout.storeDir() + "/def-openssl/lib"), IsEmpty());
    ASSERT_TRUE(isLink(layout.storeDir() + "/def-openssl/libdir"));
}

TEST_F(InstallStoreTest, resumesIntoReadOnlyStoreDirectory)
{
    writeFileAt(layout.storeDir() + "/abc-nix-2.24.9/bin/nix", "from the first attempt");
    makeReadOnly(layout.storeDir());

    installStore(layout, goodInstaller());

    ASSERT_EQ(readFile(layout.storeDir() + "/abc-nix-2.24.9/bin/nix"), "from the first attempt");
    ASSERT_TRUE(pathExists(layout.storeDir() + "/def-openssl/lib"));
}

TEST(isCompleteStoreEntry, writeBits)
{
    struct stat st{};
    st.st_mode = S_IFDIR | 0555;
    ASSERT_TRUE(isCompleteStoreEntry(st));
    st.st_mode = S_IFDIR | 0755;
    ASSERT_FALSE(isCompleteStoreEntry(st));
    st.st_mode = S_IFREG | 0464;
    ASSERT_FALSE(isCompleteStoreEntry(st));
    st.st_mode = S_IFLNK | 0777;
    ASSERT_TRUE(isCompleteStoreEntry(st));
}

TEST_F(InstallStoreTest, replacesStaleBinLink)
{
    createDirs(layout.root);
    createSymlink("/nowhere", layout.binLink());

    installStore(layout, goodInstaller());

    ASSERT_EQ(readLink(layout.binLink()), "/nix/store/abc-nix-2.24.9/bin");
}

TEST_F(InstallStoreTest, artifactWithoutStore)
{
    auto options = installer("mkdir -p \"$1/unpack/empty\"\n");

    ASSERT_THROW(installStore(layout, options), BadArtifact);
    ASSERT_FALSE(layout.isInstalled());
    ASSERT_FALSE(pathExists(layout.closureFile()));
}

TEST_F(InstallStoreTest, artifactWithoutStorePathLine)
{
    auto options = installer(
        "mkdir -p \"$1/unpack/nix/store/abc-nix\"\n"
        "echo 'nothing to see' > \"$1/unpack/nix/install\"\n");

    ASSERT_THROW(installStore(layout, options), BadArtifact);
    ASSERT_FALSE(pathExists(layout.closureFile()));
}

TEST_F(InstallStoreTest, artifactWithoutInstallScript)
{
    auto options = installer("mkdir -p \"$1/unpack/nix/store/abc-nix\"\n");

    ASSERT_THROW(installStore(layout, options), BadArtifact);
}

TEST_F(InstallStoreTest, failingInstaller)
{
    auto options = installer("exit 7\n");

    try {
        installStore(layout, options);
        FAIL() << "installStore should have thrown";
    } catch (ExecError & e) {
        ASSERT_EQ(WEXITSTATUS(e.status), 7);
    }
    ASSERT_FALSE(layout.isInstalled());
}

TEST_F(InstallStoreTest, scratchDirectoryIsRemoved)
{
    installStore(layout, goodInstaller());
    ASSERT_THAT(readDirectory(tmpDir + "/tmp"), IsEmpty());

    StoreLayout other{.root = tmpDir + "/other"};
    ASSERT_THROW(installStore(other, installer("exit 1\n")), ExecError);
    ASSERT_THAT(readDirectory(tmpDir + "/tmp"), IsEmpty());
}

}
