#pragma once
///@file

namespace baseimg {

/**
 * Restore the process state a freshly exec'd program expects: the
 * signal mask saved at startup.
 */
void restoreProcessContext();

/**
 * Number of threads in the calling process, as listed under
 * `/proc/self/task`.
 */
unsigned int getThreadCount();

}
