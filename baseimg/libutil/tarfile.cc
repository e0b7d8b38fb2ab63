#include <archive.h>
#include <archive_entry.h>

#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/signals.hh"
#include "baseimg/libutil/tarfile.hh"

#include <algorithm>
#include <fcntl.h>
#include <vector>

namespace baseimg {

static std::string errorString(struct archive * archive)
{
    auto s = archive_error_string(archive);
    return s ? s : "unknown error";
}

static void checkLibArchive(struct archive * archive, int err, const std::string & reason)
{
    if (err == ARCHIVE_EOF)
        throw EndOfFile("reached end of archive");
    else if (err != ARCHIVE_OK)
        throw ArchiveError(reason, errorString(archive));
}

void TarArchive::check(int err, const std::string & reason)
{
    checkLibArchive(archive.get(), err, reason);
}

TarArchive::TarArchive(const Path & path)
    : archive{archive_read_new()}
{
    archive_read_support_filter_all(archive.get());
    archive_read_support_format_all(archive.get());
    check(archive_read_open_filename(archive.get(), path.c_str(), 16384), "failed to open archive: %s");
}

void TarArchive::close()
{
    check(archive_read_close(archive.get()), "failed to close archive (%s)");
}

static void extractArchive(TarArchive & archive, const Path & destDir)
{
    int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM
        | ARCHIVE_EXTRACT_SECURE_SYMLINKS | ARCHIVE_EXTRACT_SECURE_NODOTDOT;

    for (;;) {
        checkInterrupt();

        struct archive_entry * entry;
        int r = archive_read_next_header(archive.archive.get(), &entry);
        if (r == ARCHIVE_EOF)
            break;
        auto name = archive_entry_pathname(entry);
        if (!name)
            throw ArchiveError("cannot get archive member name: %s", errorString(archive.archive.get()));
        if (r == ARCHIVE_WARN)
            printTaggedWarning("%s", errorString(archive.archive.get()));
        else
            archive.check(r);

        archive_entry_copy_pathname(entry, (destDir + "/" + name).c_str());

        // read-only directories still need to be entered while extracting
        if (archive_entry_filetype(entry) == AE_IFDIR && (archive_entry_mode(entry) & 0500) != 0500)
            archive_entry_set_mode(entry, archive_entry_mode(entry) | 0500);

        const char * originalHardlink = archive_entry_hardlink(entry);
        if (originalHardlink)
            archive_entry_copy_hardlink(entry, (destDir + "/" + originalHardlink).c_str());

        archive.check(archive_read_extract(archive.archive.get(), entry, flags));
    }

    archive.close();
}

void unpackTarfile(const Path & tarFile, const Path & destDir)
{
    auto archive = TarArchive(tarFile);

    createDirs(destDir);
    extractArchive(archive, destDir);
}

void TarWriter::check(int err, const std::string & reason)
{
    if (err == ARCHIVE_WARN)
        printTaggedWarning("%s", errorString(archive.get()));
    else
        checkLibArchive(archive.get(), err, reason);
}

TarWriter::TarWriter(const Path & tarFile, const std::string & filter, unsigned int threads)
    : archive(archive_write_new())
{
    check(archive_write_set_format_gnutar(archive.get()), "set format tar (%s)");

    if (filter == "none")
        check(archive_write_add_filter_none(archive.get()), "add filter none (%s)");
    else
        check(archive_write_add_filter_by_name(archive.get(), filter.c_str()),
            "add filter " + filter + " (%s)");

    if (filter == "xz" || filter == "zstd") {
        auto threadsStr = std::to_string(threads);
        auto r = archive_write_set_filter_option(archive.get(), filter.c_str(), "threads", threadsStr.c_str());
        if (r == ARCHIVE_WARN)
            printTaggedWarning("compressor '%s' ignored the thread count: %s",
                filter, errorString(archive.get()));
        else
            check(r, "setting compressor threads (%s)");
    }

    check(archive_write_open_filename(archive.get(), tarFile.c_str()),
        "opening archive '" + tarFile + "' (%s)");
}

void TarWriter::addFile(const Path & path, const std::string & name)
{
    checkInterrupt();

    auto st = lstat(path);

    std::unique_ptr<struct archive_entry, decltype([](auto * e) { archive_entry_free(e); })> entry{archive_entry_new()};
    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_set_pathname(entry.get(), name.c_str());

    if (S_ISLNK(st.st_mode)) {
        auto target = readLink(path);
        archive_entry_set_symlink(entry.get(), target.c_str());
    } else if (!S_ISDIR(st.st_mode) && !S_ISREG(st.st_mode))
        throw ArchiveError("file '%1%' has an unsupported type", path);

    check(archive_write_header(archive.get(), entry.get()), "writing archive header (%s)");

    if (S_ISREG(st.st_mode)) {
        AutoCloseFD fd{open(path.c_str(), O_RDONLY | O_CLOEXEC)};
        if (!fd)
            throw SysError("opening file '%1%'", path);

        std::vector<char> buf(64 * 1024);
        while (true) {
            checkInterrupt();
            auto n = read(fd.get(), buf.data(), buf.size());
            if (n == -1) {
                if (errno == EINTR) continue;
                throw SysError("reading file '%1%'", path);
            }
            if (n == 0) break;
            if (archive_write_data(archive.get(), buf.data(), n) != n)
                throw ArchiveError("writing '%s' to archive: %s", path, errorString(archive.get()));
        }
    }

    if (S_ISDIR(st.st_mode)) {
        std::vector<std::string> names;
        for (auto & e : readDirectory(path))
            names.push_back(e.name);
        std::sort(names.begin(), names.end());
        for (auto & child : names)
            addFile(path + "/" + child, (name == "./" ? "./" : name + "/") + child);
    }
}

void TarWriter::addTree(const Path & dir)
{
    try {
        addFile(dir, "./");
    } catch (Error & e) {
        e.addTrace("archiving '%1%'", dir);
        throw;
    }
}

void TarWriter::close() &&
{
    check(archive_write_close(archive.get()), "closing archive (%s)");
}

void writeTarfile(const Path & srcDir, const Path & tarFile, const std::string & filter, unsigned int threads)
{
    TarWriter writer(tarFile, filter, threads);
    writer.addTree(srcDir);
    std::move(writer).close();
}

}
