#include "baseimg/libimage/packager.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/tarfile.hh"

#include <cstdio>

namespace baseimg {

TarArchiver::TarArchiver(Path outputFile, std::string filter, unsigned int threads)
    : outputFile(std::move(outputFile))
    , filter(std::move(filter))
    , threads(threads)
{
}

void TarArchiver::archive(const Path & imageDir)
{
    printInfo("compressing the image into '%s'", outputFile);

    /* An interrupted run leaves any previous image alone. */
    auto tmpFile = outputFile + ".tmp";
    AutoDelete delTmpFile(tmpFile);

    writeTarfile(imageDir, tmpFile, filter, threads);

    if (rename(tmpFile.c_str(), outputFile.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", tmpFile, outputFile);
    delTmpFile.cancel();
}

const StringSet imageTopLevelEntries = {".base", ".bin", "etc", "var", "store"};

CopyIgnoreFn imageFilter(const Path & sourceRoot, const Closure & keep)
{
    auto root = canonPath(sourceRoot);
    auto store = root == "/" ? "/store" : root + "/store";

    return [root, store, keep](const Path & dir, const StringSet & entries) {
        StringSet skip;
        auto current = canonPath(dir);

        if (current == root) {
            for (auto & name : entries)
                if (!imageTopLevelEntries.contains(name))
                    skip.insert(name);
        } else if (current == store) {
            for (auto & name : entries)
                if (!keep.contains(name))
                    skip.insert(name);
        }

        return skip;
    };
}

void packageImage(
    const Closure & keep,
    const Path & storeSource,
    const Path & buildOutputPath,
    const Path & outDir,
    Archiver & archiver)
{
    printInfo("copying '%s' into '%s'", storeSource, outDir);
    copyTree(storeSource, outDir, imageFilter(storeSource, keep));

    auto baseLink = outDir + "/.base";
    if (maybeLstat(baseLink))
        deletePath(baseLink);

    printInfo("symlinking '%s' to '%s'", baseLink, buildOutputPath);
    createSymlink(buildOutputPath, baseLink);

    archiver.archive(outDir);

    printInfo("done");
}

}
