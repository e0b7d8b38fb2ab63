#pragma once
///@file

#include "baseimg/libimage/build-runner.hh"
#include "baseimg/libimage/closure.hh"
#include "baseimg/libimage/packager.hh"
#include "baseimg/libutil/mount.hh"
#include "baseimg/libutil/types.hh"

#include <functional>
#include <memory>

namespace baseimg {

/**
 * Everything the worker needs, decided by the supervisor before it
 * forks.
 */
struct ImageJob
{
    /**
     * The installed store, mounted on `storeMountPoint` in the build root.
     */
    Path basePath;
    Path stagingDir;
    /**
     * Absolute path of the archive to write.
     */
    Path output;
    Closure installerClosure;
    Path hostRoot = "/";
    std::string storeMountPoint = "nix";
    bool recursiveHostBinds = true;

    /**
     * An `ImageJob` for `basePath` from `settings`. `stagingDir` and
     * `installerClosure` are left empty.
     */
    static ImageJob fromSettings(const Path & basePath);
};

/**
 * The system calls and the archiver the worker uses.
 */
struct WorkerHooks
{
    MountSyscall mount = ::mount;
    ChangeRoot changeRoot = chrootInto;
    /**
     * Makes the archiver for `ImageJob::output`. The default writes a
     * tar archive compressed as `settings` say.
     */
    std::function<std::unique_ptr<Archiver>(const Path & output)> makeArchiver;
};

/**
 * The worker: enter an isolated user and mount namespace, compose the
 * build root, change root into it, run the build and package the image
 * from the union of the installer's and the build's closures.
 *
 * Must run in a single-threaded process, which it leaves isolated and
 * changed into the build root.
 *
 * @return the worker's exit status: 0 on success and when interrupted
 * during the build or the packaging, 1 on any other failure, which is
 * logged.
 */
int runImageWorker(const ImageJob & job, const BuildOptions & options, const WorkerHooks & hooks = {});

/**
 * Run `worker` in a child process and wait for it.
 *
 * @throws Error if the child exits with a non-zero status or is killed.
 */
void superviseWorker(std::function<int()> worker);

/**
 * Install the store into `basePath` if needed, then build the image in
 * a worker process and wait for it.
 *
 * @throws Error if the worker fails.
 */
void buildBaseImage(const Path & basePath);

}
