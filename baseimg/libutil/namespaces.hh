#pragma once
///@file

#include "baseimg/libutil/error.hh"
#include "baseimg/libutil/types.hh"

#include <sys/types.h>

namespace baseimg {

/**
 * One line of a user namespace's `uid_map` or `gid_map`: `count` ids
 * starting at `inside` in the namespace map to ids starting at
 * `outside` in the parent namespace.
 */
struct IdMapping
{
    unsigned int inside;
    unsigned int outside;
    unsigned int count = 1;

    std::string to_string() const;

    /**
     * Map `id` to itself, and nothing else.
     */
    static IdMapping identity(unsigned int id)
    {
        return {.inside = id, .outside = id, .count = 1};
    }
};

class IsolatedNamespace;

/**
 * Move the calling process into a new user namespace and a new mount
 * namespace, in a single `unshare(2)`, and map the caller's uid and gid
 * to themselves inside it. `setgroups` is denied before the gid map is
 * written.
 *
 * The process must have exactly one thread. This can succeed at most
 * once per process; a second call throws `SysError` with `EALREADY`.
 *
 * @return the proof that the process now owns its mount namespace.
 */
IsolatedNamespace enterIsolatedNamespace();

/**
 * Capability token handed out by `enterIsolatedNamespace()`. Functions
 * that mount or chroot take one by reference so they cannot run in the
 * host namespace.
 */
class IsolatedNamespace
{
    uid_t uid_;
    gid_t gid_;

    IsolatedNamespace(uid_t uid, gid_t gid) : uid_(uid), gid_(gid) { }

    friend IsolatedNamespace enterIsolatedNamespace();

public:
    IsolatedNamespace(const IsolatedNamespace &) = delete;
    IsolatedNamespace & operator=(const IsolatedNamespace &) = delete;
    IsolatedNamespace(IsolatedNamespace &&) = default;
    IsolatedNamespace & operator=(IsolatedNamespace &&) = default;

    uid_t uid() const { return uid_; }
    gid_t gid() const { return gid_; }
};

/**
 * A kernel setting forbids unprivileged user namespaces.
 */
MakeError(PolicyError, Error);

/**
 * Check the kernel switches that can forbid unprivileged user
 * namespaces: `unprivileged_userns_clone` must be 1 and
 * `apparmor_restrict_unprivileged_userns` must be 0. Switches that do
 * not exist are not checked. Only reads files.
 *
 * @param sysKernelDir where to look for the switches.
 *
 * @throws PolicyError naming the offending switch.
 */
void checkUserNamespacePolicy(const Path & sysKernelDir = "/proc/sys/kernel");

/**
 * Whether a child process can be started in a new user namespace. The
 * answer is computed once.
 */
bool userNamespacesSupported();

}
