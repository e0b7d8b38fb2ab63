#include "baseimg/libutil/current-process.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/namespaces.hh"
#include "baseimg/libutil/processes.hh"
#include "baseimg/libutil/strings.hh"

#include <sched.h>
#include <unistd.h>

namespace baseimg {

std::string IdMapping::to_string() const
{
    return fmt("%d %d %d\n", inside, outside, count);
}

static bool namespaceEntered = false;

IsolatedNamespace enterIsolatedNamespace()
{
    if (namespaceEntered)
        throw SysError(EALREADY, "this process already entered its isolated namespace");

    auto threads = getThreadCount();
    if (threads != 1)
        throw Error("cannot enter a user namespace from a process with %d threads", threads);

    uid_t uid = getuid();
    gid_t gid = getgid();

    debug("unsharing user and mount namespaces");

    if (unshare(CLONE_NEWUSER | CLONE_NEWNS) == -1)
        throw SysError("creating user and mount namespaces");

    namespaceEntered = true;

    /* The kernel refuses an unprivileged gid_map write until setgroups
       is denied. */
    try {
        writeFile("/proc/self/uid_map", IdMapping::identity(uid).to_string());
        writeFile("/proc/self/setgroups", "deny");
        writeFile("/proc/self/gid_map", IdMapping::identity(gid).to_string());
    } catch (Error & e) {
        e.addTrace("mapping uid %d and gid %d into the new user namespace", uid, gid);
        throw;
    }

    return IsolatedNamespace{uid, gid};
}

static void checkSwitch(const Path & sysKernelDir, const std::string & name, int expected)
{
    auto path = sysKernelDir + "/" + name;
    if (!pathExists(path)) {
        debug("'%s' does not exist, not checking it", path);
        return;
    }

    auto contents = trim(readFile(path));
    auto value = string2Int<int>(contents);
    if (!value)
        throw PolicyError("cannot parse the contents of '%s' ('%s') as an integer", path, contents);

    if (*value != expected)
        throw PolicyError(
            "unprivileged user namespaces are restricted by '%s' (it is %d, it must be %d)",
            name, *value, expected);
}

void checkUserNamespacePolicy(const Path & sysKernelDir)
{
    checkSwitch(sysKernelDir, "unprivileged_userns_clone", 1);
    checkSwitch(sysKernelDir, "apparmor_restrict_unprivileged_userns", 0);
}

bool userNamespacesSupported()
{
    static auto res = [&]() -> bool
    {
        try {
            Pid pid = startProcess([&]() { _exit(0); }, {.cloneFlags = CLONE_NEWUSER});

            auto r = pid.wait();
            if (!statusOk(r)) {
                debug("checking for user namespaces %s", statusToString(r));
                return false;
            }
        } catch (SysError & e) {
            printTaggedWarning("user namespaces do not work on this system: %s", e.msg());
            return false;
        }

        return true;
    }();
    return res;
}

}
