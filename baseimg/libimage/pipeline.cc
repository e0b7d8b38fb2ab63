#include "baseimg/libimage/globals.hh"
#include "baseimg/libimage/pipeline.hh"
#include "baseimg/libimage/staging.hh"
#include "baseimg/libimage/store-installer.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/namespaces.hh"
#include "baseimg/libutil/processes.hh"
#include "baseimg/libutil/signals.hh"

#include <unistd.h>

namespace baseimg {

ImageJob ImageJob::fromSettings(const Path & basePath)
{
    return {
        .basePath = absPath(basePath),
        .output = absPath(settings.output.get()),
        .storeMountPoint = settings.storeMountPoint.get(),
        .recursiveHostBinds = settings.recursiveHostBinds.get(),
    };
}

int runImageWorker(const ImageJob & job, const BuildOptions & options, const WorkerHooks & hooks)
{
    try {
        auto ns = enterIsolatedNamespace();

        installInterruptHandlers();

        auto plan = planStaging(job.hostRoot, job.storeMountPoint, job.basePath, job.stagingDir, job.recursiveHostBinds);
        composeStaging(ns, plan, hooks.mount);

        try {
            Path root;
            auto build = runIsolatedBuild(ns, job.stagingDir, options, [&](const Path & stagingDir) {
                return root = hooks.changeRoot(stagingDir);
            });

            Closure keep = job.installerClosure;
            keep.insert(build.closure.begin(), build.closure.end());

            auto imageDir = createTempDir(defaultTempDir(), "base-img-image");
            AutoDelete delImageDir(imageDir, true);

            std::unique_ptr<Archiver> archiver;
            if (hooks.makeArchiver)
                archiver = hooks.makeArchiver(job.output);
            else
                archiver = std::make_unique<TarArchiver>(job.output, settings.compression.get(), settings.compressionThreads.get());

            auto storeSource = root == "/" ? "/" + job.storeMountPoint : root + "/" + job.storeMountPoint;
            packageImage(keep, storeSource, build.outputPath, imageDir, *archiver);
        } catch (Interrupted &) {
            printError("interrupted, no image was written");
        }
    } catch (BaseError & e) {
        logError(e.info());
        return 1;
    }

    return 0;
}

void superviseWorker(std::function<int()> worker)
{
    Pid pid = startProcess([&]() { _exit(worker()); });

    int status = pid.wait();
    checkInterrupt();

    if (!statusOk(status))
        throw Error("building the image %s", statusToString(status));
}

void buildBaseImage(const Path & basePath)
{
    auto job = ImageJob::fromSettings(basePath);

    job.installerClosure = installStore(StoreLayout{job.basePath}, InstallerOptions::fromSettings());

    StagingTree staging;
    job.stagingDir = staging.path();

    auto options = BuildOptions::fromSettings();

    superviseWorker([&]() { return runImageWorker(job, options); });
}

}
