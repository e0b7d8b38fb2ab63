#pragma once
///@file

#include "baseimg/libutil/error.hh"
#include "baseimg/libutil/types.hh"

#include <archive.h>
#include <memory>

namespace baseimg {

MakeError(ArchiveError, Error);

/**
 * A tar archive opened for reading, in any format and with any
 * compression libarchive understands.
 */
struct TarArchive
{
    std::unique_ptr<struct archive, decltype([](auto * p) { archive_read_free(p); })> archive;

    void check(int err, const std::string & reason = "failed to extract archive (%s)");

    TarArchive(const Path & path);

    TarArchive(const TarArchive &) = delete;

    void close();
};

void unpackTarfile(const Path & tarFile, const Path & destDir);

/**
 * Writes a directory tree into a GNU tar archive.
 */
class TarWriter
{
    std::unique_ptr<struct archive, decltype([](auto * a) { archive_write_free(a); })> archive;

    void check(int err, const std::string & reason);

    void addFile(const Path & path, const std::string & name);

public:
    /**
     * @param filter libarchive name of the compression filter (`xz`,
     * `gzip`, `zstd`, ...) or `none`.
     * @param threads number of compressor threads, 0 for one per core.
     * Ignored by filters without threading support.
     */
    TarWriter(const Path & tarFile, const std::string & filter, unsigned int threads);

    /**
     * Add `dir` and everything below it. Member names are relative to
     * `dir` and start with `./`; directory entries are added in name
     * order.
     */
    void addTree(const Path & dir);

    void close() &&;
};

/**
 * Write the contents of `srcDir` to the archive `tarFile`.
 */
void writeTarfile(const Path & srcDir, const Path & tarFile, const std::string & filter = "xz", unsigned int threads = 0);

}
