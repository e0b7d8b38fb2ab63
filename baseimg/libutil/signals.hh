#pragma once
/** @file Signal handling
 *
 * The main process runs a dedicated signal handler thread that turns
 * SIGINT, SIGTERM and SIGHUP into interrupt requests, which are acted
 * upon by `checkInterrupt()`. Processes forked to do isolated work are
 * single-threaded and use `installInterruptHandlers()` instead.
 *
 * Processes that exec another program should call `restoreSignals()`
 * first so the program starts with the signal mask we started with.
 */

#include "baseimg/libutil/error.hh"

#include <atomic>
#include <signal.h>

namespace baseimg {

/* User interruption. */

// number of interrupt requests (SIGINT, SIGTERM, SIGHUP) received so far
extern std::atomic<unsigned int> _interruptSequence;

// the largest `_interruptSequence` the current thread has acted upon
extern thread_local std::atomic<unsigned int>::value_type threadInterruptSeq;

void _interrupted();

bool isInterrupted();

/**
 * Throw `Interrupted` if an interrupt request arrived since this thread
 * last acted upon one.
 */
void inline checkInterrupt()
{
    const auto seq = _interruptSequence.load(std::memory_order::relaxed);
    if (seq > threadInterruptSeq) {
        threadInterruptSeq = seq;
        _interrupted();
    }
}

MakeError(Interrupted, BaseError);

void triggerInterrupt();

void restoreSignals();

/**
 * Start a thread that handles various signals. Also block those signals
 * on the current thread (and thus any threads created by it).
 *
 * Also saves the signal mask before changing the mask to block those
 * signals. See saveSignalMask().
 */
void startSignalHandlerThread();

/**
 * Saves the signal mask, which is the signal mask that will be
 * restored before creating child processes.
 */
void saveSignalMask();

/**
 * For single-threaded processes: handle SIGINT, SIGTERM and SIGHUP with
 * an async-signal-safe handler that records an interrupt request, and
 * unblock them. Blocking system calls return `EINTR` so the request is
 * noticed by the next `checkInterrupt()`.
 */
void installInterruptHandlers();

}
