#include "baseimg/libutil/current-process.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/signals.hh"

namespace baseimg {

void restoreProcessContext()
{
    restoreSignals();
}

unsigned int getThreadCount()
{
    return readDirectory("/proc/self/task").size();
}

}
