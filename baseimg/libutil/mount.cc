#include "baseimg/libutil/mount.hh"
#include "baseimg/libutil/error.hh"
#include "baseimg/libutil/logging.hh"
#if __linux__

namespace baseimg {

void bindMount(const Path & source, const Path & target, bool recursive, const MountSyscall & syscall)
{
    debug("bind mounting '%1%' to '%2%'%3%", source, target, recursive ? " (recursive)" : "");

    unsigned long flags = MS_BIND;
    if (recursive)
        flags |= MS_REC;

    if (syscall(source.c_str(), target.c_str(), "", flags, nullptr) == -1)
        throw SysError("bind mount from '%1%' to '%2%' failed", source, target);
}

}

#endif
