#include "baseimg/libimage/closure.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/strings.hh"

namespace baseimg {

Closure readClosureFile(const Path & path)
{
    Closure closure;
    for (auto & line : tokenizeString<Strings>(readFile(path), "\n")) {
        auto name = trim(line);
        if (!name.empty())
            closure.insert(name);
    }
    return closure;
}

void writeClosureFile(const Path & path, const Closure & closure)
{
    std::string contents;
    for (auto & name : closure)
        contents += name + "\n";
    writeFile(path, contents);
}

Closure closureFromStorePaths(std::string_view listing)
{
    Closure closure;
    for (auto & line : tokenizeString<Strings>(listing, "\n")) {
        auto path = trim(line);
        if (path.empty())
            continue;
        auto name = baseNameOf(path);
        if (name.empty())
            throw BadArtifact("'%s' is not a store path", path);
        closure.insert(std::string(name));
    }
    return closure;
}

}
