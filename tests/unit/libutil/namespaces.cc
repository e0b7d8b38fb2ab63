#include "baseimg/libutil/current-process.hh"
#include "baseimg/libutil/mount.hh"
#include "baseimg/libutil/namespaces.hh"
#include "tests/test-files.hh"

#include <gtest/gtest.h>

#include <future>
#include <thread>

namespace baseimg {

TEST(IdMapping, formatsMapLine)
{
    ASSERT_EQ(IdMapping::identity(1000).to_string(), "1000 1000 1\n");
    ASSERT_EQ((IdMapping{.inside = 0, .outside = 100000, .count = 65536}).to_string(), "0 100000 65536\n");
}

class UserNamespacePolicyTest : public TmpDirTest
{
protected:
    void setSwitch(const std::string & name, const std::string & value)
    {
        writeFile(tmpDir + "/" + name, value);
    }
};

TEST_F(UserNamespacePolicyTest, missingSwitchesAreNotChecked)
{
    ASSERT_NO_THROW(checkUserNamespacePolicy(tmpDir));
}

TEST_F(UserNamespacePolicyTest, permissiveSwitchesPass)
{
    setSwitch("unprivileged_userns_clone", "1\n");
    setSwitch("apparmor_restrict_unprivileged_userns", "0\n");

    ASSERT_NO_THROW(checkUserNamespacePolicy(tmpDir));
}

TEST_F(UserNamespacePolicyTest, disabledCloneIsRejected)
{
    setSwitch("unprivileged_userns_clone", "0\n");

    ASSERT_THROW(checkUserNamespacePolicy(tmpDir), PolicyError);
}

TEST_F(UserNamespacePolicyTest, appArmorRestrictionIsRejected)
{
    setSwitch("unprivileged_userns_clone", "1\n");
    setSwitch("apparmor_restrict_unprivileged_userns", "1\n");

    ASSERT_THROW(checkUserNamespacePolicy(tmpDir), PolicyError);
}

TEST_F(UserNamespacePolicyTest, garbageIsRejected)
{
    setSwitch("apparmor_restrict_unprivileged_userns", "maybe\n");

    ASSERT_THROW(checkUserNamespacePolicy(tmpDir), PolicyError);
}

TEST(getThreadCount, countsThreads)
{
    auto before = getThreadCount();
    ASSERT_GE(before, 1);

    std::promise<void> release;
    auto released = release.get_future();
    std::thread t([&]() { released.wait(); });

    EXPECT_EQ(getThreadCount(), before + 1);

    release.set_value();
    t.join();
}

TEST(enterIsolatedNamespace, refusesMultithreadedProcess)
{
    auto res = runInChild([]() {
        std::promise<void> release;
        auto released = release.get_future();
        std::thread t([&]() { released.wait(); });

        int res = 0;
        try {
            enterIsolatedNamespace();
            res = 2;
        } catch (SysError &) {
            res = 3;
        } catch (Error &) {
            res = 0;
        }

        release.set_value();
        t.join();
        return res;
    });

    ASSERT_EQ(res, 0);
}

class IsolatedNamespaceTest : public TmpDirTest
{
protected:
    void SetUp() override
    {
        if (!userNamespacesSupported())
            GTEST_SKIP() << "user namespaces are not available";
    }
};

TEST_F(IsolatedNamespaceTest, keepsIdsAndRefusesSecondEntry)
{
    auto uid = getuid();
    auto gid = getgid();

    auto res = runInChild([&]() {
        auto ns = enterIsolatedNamespace();
        if (ns.uid() != uid || ns.gid() != gid)
            return 2;
        if (getuid() != uid || getgid() != gid)
            return 3;
        try {
            enterIsolatedNamespace();
            return 4;
        } catch (SysError & e) {
            return e.errNo == EALREADY ? 0 : 5;
        }
    });

    ASSERT_EQ(res, 0);
}

TEST_F(IsolatedNamespaceTest, mountsStayInsideTheNamespace)
{
    createDirs(tmpDir + "/source");
    createDirs(tmpDir + "/target");
    writeFile(tmpDir + "/source/marker", "");

    auto res = runInChild([&]() {
        enterIsolatedNamespace();
        bindMount(tmpDir + "/source", tmpDir + "/target");
        return pathExists(tmpDir + "/target/marker") ? 0 : 2;
    });

    ASSERT_EQ(res, 0);
    ASSERT_FALSE(pathExists(tmpDir + "/target/marker"));
}

}
