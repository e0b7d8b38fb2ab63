#pragma once
/**
 * @file
 *
 * Utiltities for working with the file sytem and file paths.
 */

#include "baseimg/libutil/types.hh"
#include "baseimg/libutil/file-descriptor.hh"

#include <sys/types.h>
#include <sys/stat.h>
#include <dirent.h>
#include <unistd.h>

#include <functional>
#include <memory>
#include <optional>

#ifndef HAVE_STRUCT_DIRENT_D_TYPE
#define DT_UNKNOWN 0
#define DT_REG 1
#define DT_LNK 2
#define DT_DIR 3
#endif

namespace baseimg {

/**
 * Get the current working directory.
 *
 * Throw an error if the current directory cannot get got.
 */
Path getCwd();

/**
 * @return An absolutized path, resolving paths relative to the
 * specified directory, or the current directory otherwise.  The path
 * is also canonicalised.
 */
Path absPath(Path path, std::optional<PathView> dir = {}, bool resolveSymlinks = false);

/**
 * Canonicalise a path by removing all `.` or `..` components and
 * double or trailing slashes.  Optionally resolves all symlink
 * components such that each component of the resulting path is *not*
 * a symbolic link.
 */
Path canonPath(PathView path, bool resolveSymlinks = false);

/**
 * Resolve a leading `~/` against `home`.
 *
 * @throws UsageError if `path` starts with `~` but there is no home, or
 * if it is a `~user` path.
 */
Path tildePath(Path const & path, const std::optional<Path> & home = std::nullopt);

/**
 * Change the permissions of a path
 * Not called `chmod` as it shadows and could be confused with
 * `int chmod(char *, mode_t)`, which does not handle errors
 */
void chmodPath(const Path & path, mode_t mode);

/**
 * @return The directory part of the given canonical path, i.e.,
 * everything before the final `/`.  If the path is the root or an
 * immediate child thereof (e.g., `/foo`), this means `/`
 * is returned.
 */
Path dirOf(const PathView path);

/**
 * @return the base name of the given canonical path, i.e., everything
 * following the final `/` (trailing slashes are removed).
 */
std::string_view baseNameOf(std::string_view path);

/**
 * Get status of `path`.
 */
struct stat stat(const Path & path);
struct stat lstat(const Path & path);

/**
 * `lstat` the given path if it exists.
 * @return std::nullopt if the path doesn't exist, or an optional containing the result of `lstat` otherwise
 */
std::optional<struct stat> maybeLstat(const Path & path);

/**
 * @return true iff the given path exists.
 */
bool pathExists(const Path & path);

/**
 * Read the contents (target) of a symbolic link.  The result is not
 * in any way canonicalised.
 */
Path readLink(const Path & path);

bool isLink(const Path & path);

/**
 * Read the contents of a directory.  The entries `.` and `..` are
 * removed.
 */
struct DirEntry
{
    std::string name;
    ino_t ino;
    /**
     * one of DT_*
     */
    unsigned char type;
    DirEntry(std::string name, ino_t ino, unsigned char type)
        : name(std::move(name)), ino(ino), type(type) { }
};

typedef std::vector<DirEntry> DirEntries;

DirEntries readDirectory(const Path & path);

unsigned char getFileType(const Path & path);

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const Path & path);

/**
 * Write a string to a file.
 */
void writeFile(const Path & path, std::string_view s, mode_t mode = 0666);

/**
 * Delete a path; i.e., in the case of a directory, it is deleted
 * recursively. Read-only directories are made writable first. It's
 * not an error if the path does not exist.
 */
void deletePath(const Path & path);

/**
 * Create a directory and all its parents, if necessary.  Returns the
 * list of created directories, in order of creation.
 */
Paths createDirs(const Path & path);

/**
 * Create a symlink. Throws if the symlink exists.
 */
void createSymlink(const Path & target, const Path & link);

/**
 * Decides which entries of a directory `copyTree` leaves out.
 *
 * Called once for every directory of the source tree, before any of its
 * children are visited, with that directory's path (as reached from the
 * root passed to `copyTree`) and the names of its entries. Returns the
 * names to skip.
 */
typedef std::function<StringSet(const Path & dir, const StringSet & entries)> CopyIgnoreFn;

/**
 * Recursively copy the directory `from` to `to`. Symlinks are copied
 * as symlinks, never followed. Regular files keep their permissions
 * and modification times; directories get their permissions after
 * their contents have been copied, so read-only trees can be copied.
 * `to` may already exist. Anything other than a directory, regular
 * file or symlink is an error.
 */
void copyTree(const Path & from, const Path & to, const CopyIgnoreFn & ignore = {});

/**
 * Recursively remove the write permission bits from `path` and
 * everything below it. Symlinks are left alone.
 */
void makeReadOnly(const Path & path);

/**
 * Automatic cleanup of resources.
 */
class AutoDelete
{
    Path path;
    bool del;
    bool recursive;
public:
    AutoDelete();
    AutoDelete(const Path & p, bool recursive = true);
    AutoDelete(const AutoDelete &) = delete;
    AutoDelete & operator=(const AutoDelete &) = delete;
    ~AutoDelete();
    void cancel();
    void reset(const Path & p, bool recursive = true);
    operator Path() const { return path; }
    operator PathView() const { return path; }
};

struct DIRDeleter
{
    void operator()(DIR * dir) const {
        closedir(dir);
    }
};

typedef std::unique_ptr<DIR, DIRDeleter> AutoCloseDir;

/**
 * Return `TMPDIR`, or the default temporary directory if unset or empty.
 */
Path defaultTempDir();

/**
 * Create a temporary directory.
 */
Path createTempDir(const Path & tmpRoot = "", const Path & prefix = "base-img",
    bool includePid = true, bool useGlobalCounter = true, mode_t mode = 0755);

}
