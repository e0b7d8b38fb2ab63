#pragma once
///@file

#include "baseimg/libimage/closure.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/types.hh"

namespace baseimg {

/**
 * Serialises a finished image directory.
 */
class Archiver
{
public:
    virtual ~Archiver() = default;

    virtual void archive(const Path & imageDir) = 0;
};

/**
 * Writes the image as a compressed GNU tar archive.
 */
class TarArchiver : public Archiver
{
    Path outputFile;
    std::string filter;
    unsigned int threads;

public:
    TarArchiver(Path outputFile, std::string filter = "xz", unsigned int threads = 0);

    void archive(const Path & imageDir) override;
};

/**
 * Top-level entries of the installed store directory that go into an
 * image.
 */
extern const StringSet imageTopLevelEntries;

/**
 * The copy filter of `packageImage()` for a copy of `sourceRoot`: its
 * top level is narrowed to `imageTopLevelEntries`, its `store` to the
 * names in `keep`, and everything deeper is copied whole.
 */
CopyIgnoreFn imageFilter(const Path & sourceRoot, const Closure & keep);

/**
 * Copy `storeSource` into `outDir` through `imageFilter()`, replace
 * `outDir/.base` by a symlink to `buildOutputPath` and hand `outDir` to
 * `archiver`.
 */
void packageImage(
    const Closure & keep,
    const Path & storeSource,
    const Path & buildOutputPath,
    const Path & outDir,
    Archiver & archiver);

}
