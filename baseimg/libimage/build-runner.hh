#pragma once
///@file

#include "baseimg/libimage/closure.hh"
#include "baseimg/libutil/namespaces.hh"
#include "baseimg/libutil/types.hh"

#include <functional>

namespace baseimg {

struct BuildOptions
{
    std::string buildProgram;
    std::string queryProgram;
    Path buildDescription;
    /**
     * The complete environment of both programs.
     */
    StringMap environment;

    /**
     * From `settings`: a `PATH` of `build-path` and a `NIX_CONF_DIR`
     * inside the mounted store.
     */
    static BuildOptions fromSettings();
};

struct BuildResult
{
    /**
     * What the build's `result` link points to.
     */
    Path outputPath;
    /**
     * Names of the store entries the output depends on, itself included.
     */
    Closure closure;
};

/**
 * Makes `stagingDir` the root directory.
 *
 * @return the path of the staging directory afterwards.
 */
typedef std::function<Path(const Path & stagingDir)> ChangeRoot;

/**
 * `chroot(2)` into `stagingDir`; the staging directory is then `/`.
 */
Path chrootInto(const Path & stagingDir);

/**
 * Change the root directory to `stagingDir`, then change back to the
 * current working directory, which is looked up again below the new
 * root.
 *
 * @return the path of the staging directory below the new root.
 */
Path enterStaging(const IsolatedNamespace & ns, const Path & stagingDir, const ChangeRoot & changeRoot = chrootInto);

/**
 * Run `<buildProgram> build <buildDescription>` in `workDir`, then
 * `<queryProgram> -qR <workDir>/result`.
 *
 * @throws ExecError if either program fails.
 * @throws BadArtifact if the build left no `result` link.
 */
BuildResult runBuild(const BuildOptions & options, const Path & workDir);

/**
 * `enterStaging()`, then `runBuild()` in a fresh temporary directory.
 */
BuildResult runIsolatedBuild(
    const IsolatedNamespace & ns,
    const Path & stagingDir,
    const BuildOptions & options,
    const ChangeRoot & changeRoot = chrootInto);

}
