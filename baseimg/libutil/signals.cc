#include "baseimg/libutil/signals.hh"
#include "baseimg/libutil/error.hh"
#include "baseimg/libutil/logging.hh"

#include <thread>
#include <unistd.h>

namespace baseimg {

std::atomic<unsigned int> _interruptSequence{0};
thread_local std::atomic<unsigned int>::value_type threadInterruptSeq{_interruptSequence.load()};

bool isInterrupted()
{
    return _interruptSequence.load(std::memory_order::relaxed) > threadInterruptSeq;
}

void _interrupted()
{
    /* Block user interrupts while an exception is being handled.
       Throwing an exception while another exception is being handled
       kills the program! */
    if (!std::uncaught_exceptions()) {
        throw Interrupted("interrupted by the user");
    }
}

//////////////////////////////////////////////////////////////////////

static void signalHandlerThread(sigset_t set)
{
    while (true) {
        int signal = 0;
        sigwait(&set, &signal);

        if (signal == SIGINT && _interruptSequence.load() > 0) {
            /* A second ^C: unblock and re-raise so the default action
               terminates the process. */
            sigset_t unblock;
            sigemptyset(&unblock);
            sigaddset(&unblock, signal);
            pthread_sigmask(SIG_UNBLOCK, &unblock, nullptr);
            kill(getpid(), SIGINT);
        } else if (signal == SIGINT || signal == SIGTERM || signal == SIGHUP) {
            triggerInterrupt();
        }
    }
}

void triggerInterrupt()
{
    _interruptSequence++;
}

static sigset_t savedSignalMask;
static bool savedSignalMaskIsSet = false;

void saveSignalMask() {
    if (sigprocmask(SIG_BLOCK, nullptr, &savedSignalMask))
        throw SysError("querying signal mask");

    savedSignalMaskIsSet = true;
}

void startSignalHandlerThread()
{
    saveSignalMask();

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGPIPE);
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr))
        throw SysError("blocking signals");

    std::thread(signalHandlerThread, set).detach();
}

/**
 * Restore the saved signal mask. Must only be called in a child
 * process right before exec.
 */
void restoreSignals()
{
    // If startSignalHandlerThread wasn't called, that means we're not running
    // in a proper libmain process, but a process that presumably manages its
    // own signal handlers. Such a process should call either
    //  - initBaseImg(), to be a proper libmain process
    //  - saveSignalMask(), if it wants to use this library's signal handling
    //    but not the rest of libmain
    if (!savedSignalMaskIsSet)
        return;

    if (sigprocmask(SIG_SETMASK, &savedSignalMask, nullptr))
        throw SysError("restoring signals");
}

static void interruptSignalHandler(int)
{
    _interruptSequence++;
}

void installInterruptHandlers()
{
    struct sigaction act;
    act.sa_handler = interruptSignalHandler;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;

    sigset_t set;
    sigemptyset(&set);

    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        if (sigaction(sig, &act, nullptr))
            throw SysError("installing handler for signal %d", sig);
        sigaddset(&set, sig);
    }

    if (sigprocmask(SIG_UNBLOCK, &set, nullptr))
        throw SysError("unblocking signals");
}

}
