#include "baseimg/libimage/build-runner.hh"
#include "baseimg/libimage/globals.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/processes.hh"

#include <unistd.h>

namespace baseimg {

BuildOptions BuildOptions::fromSettings()
{
    return {
        .buildProgram = settings.buildProgram.get(),
        .queryProgram = settings.queryProgram.get(),
        .buildDescription = settings.buildDescription.get(),
        .environment = {
            {"PATH", settings.buildPath.get()},
            {"NIX_CONF_DIR", settings.confDir()},
        },
    };
}

Path chrootInto(const Path & stagingDir)
{
    if (chroot(stagingDir.c_str()) == -1)
        throw SysError("cannot change root directory to '%1%'", stagingDir);
    return "/";
}

Path enterStaging(const IsolatedNamespace & ns, const Path & stagingDir, const ChangeRoot & changeRoot)
{
    auto cwd = getCwd();

    debug("changing root to '%s'", stagingDir);

    auto root = changeRoot(stagingDir);

    if (chdir(cwd.c_str()) == -1)
        throw SysError("cannot change to '%1%' inside the build root", cwd);

    return root;
}

BuildResult runBuild(const BuildOptions & options, const Path & workDir)
{
    printInfo("building '%s'", options.buildDescription);

    runProgram2({
        .program = options.buildProgram,
        .args = {"build", options.buildDescription},
        .chdir = workDir,
        .environment = options.environment,
    }).waitAndCheck();

    auto resultLink = workDir + "/result";
    if (!maybeLstat(resultLink) || !isLink(resultLink))
        throw BadArtifact("the build did not leave a 'result' link in '%s'", workDir);

    BuildResult result{.outputPath = readLink(resultLink)};

    auto [status, listing] = runProgram({
        .program = options.queryProgram,
        .args = {"-qR", resultLink},
        .chdir = workDir,
        .environment = options.environment,
    });
    if (!statusOk(status))
        throw ExecError(status, "program '%1%' %2%", options.queryProgram, statusToString(status));

    result.closure = closureFromStorePaths(listing);

    debug("'%s' depends on %d store entries", result.outputPath, result.closure.size());

    return result;
}

BuildResult runIsolatedBuild(
    const IsolatedNamespace & ns,
    const Path & stagingDir,
    const BuildOptions & options,
    const ChangeRoot & changeRoot)
{
    enterStaging(ns, stagingDir, changeRoot);

    auto workDir = createTempDir(defaultTempDir(), "base-img-build");
    AutoDelete delWorkDir(workDir, true);

    return runBuild(options, workDir);
}

}
