#pragma once
///@file

#include "baseimg/libutil/types.hh"

#include <functional>

#if __linux__
#include <sys/mount.h>

namespace baseimg {

/**
 * Signature of `mount(2)`. Everything that mounts goes through one of
 * these so the call can be replaced in tests.
 */
typedef std::function<int(
    const char * source, const char * target, const char * fstype, unsigned long flags, const void * data
)> MountSyscall;

/**
 * Bind-mount the directory `source` onto the existing directory
 * `target`. With `recursive`, mounts below `source` are carried along
 * (`MS_REC`).
 *
 * The caller must own the mount namespace it is changing; calling this
 * in the host namespace changes the host's mount table.
 *
 * @throws SysError carrying the errno of the failed call.
 */
void bindMount(
    const Path & source, const Path & target, bool recursive = false, const MountSyscall & syscall = ::mount
);

}
#endif
