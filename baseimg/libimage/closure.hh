#pragma once
///@file

#include "baseimg/libutil/types.hh"

namespace baseimg {

/**
 * Names (not paths) of store entries that must be kept.
 */
typedef StringSet Closure;

/**
 * Read a closure written by `writeClosureFile()`: one name per line,
 * empty lines ignored.
 */
Closure readClosureFile(const Path & path);

/**
 * Write `closure` to `path`, one name per line in sorted order, each
 * line terminated by a newline.
 */
void writeClosureFile(const Path & path, const Closure & closure);

/**
 * Turn a listing of store paths, one per line, into the set of their
 * base names.
 */
Closure closureFromStorePaths(std::string_view listing);

}
