#include "baseimg/libimage/globals.hh"
#include "baseimg/libimage/store-installer.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/processes.hh"
#include "baseimg/libutil/regex.hh"

#include <algorithm>
#include <deque>

namespace baseimg {

const std::string defaultNixConf =
    "experimental-features = nix-command flakes\n"
    "sandbox = false\n"
    "build-users-group =\n";

bool StoreLayout::isInstalled() const
{
    return pathExists(storeDir()) && pathExists(cacheDir()) && pathExists(confDir());
}

InstallerOptions InstallerOptions::fromSettings()
{
    return {
        .program = settings.installer.get(),
        .storeDir = settings.storeDir(),
    };
}

bool isCompleteStoreEntry(const struct stat & st)
{
    return S_ISLNK(st.st_mode) || (st.st_mode & (S_IWUSR | S_IWGRP | S_IWOTH)) == 0;
}

std::optional<Path> findStoreDir(const Path & root)
{
    std::deque<Path> queue{root};

    while (!queue.empty()) {
        auto dir = std::move(queue.front());
        queue.pop_front();

        std::vector<std::string> subdirs;
        for (auto & entry : readDirectory(dir)) {
            auto type = entry.type == DT_UNKNOWN ? getFileType(dir + "/" + entry.name) : entry.type;
            if (type == DT_DIR)
                subdirs.push_back(entry.name);
        }
        std::sort(subdirs.begin(), subdirs.end());

        for (auto & name : subdirs) {
            if (name == "store")
                return dir + "/" + name;
            queue.push_back(dir + "/" + name);
        }
    }

    return std::nullopt;
}

Path parseInstallScript(std::string_view script, const Path & storeDir)
{
    static const std::string prefix = R"(nix=")";
    auto re = regex::parse(prefix + "(" + regex::quoteRegexChars(storeDir) + R"re(/[^"]*))re");

    if (auto path = regex::firstLineMatch(script, re))
        return *path;

    throw BadArtifact("could not detect store path: the install script has no line starting with '%s%s/'", prefix, storeDir);
}

Closure installStore(const StoreLayout & layout, const InstallerOptions & installer)
{
    if (layout.isInstalled()) {
        printInfo("using the store already installed in '%s'", layout.root);
        try {
            return readClosureFile(layout.closureFile());
        } catch (Error & e) {
            e.addTrace("reading the closure of the store installed in '%s'", layout.root);
            throw;
        }
    }

    printInfo("installing the package manager into '%s'", layout.root);

    auto scratch = createTempDir(defaultTempDir(), "base-img-install");
    AutoDelete delScratch(scratch, true);

    runProgram2({
        .program = installer.program,
        .args = {scratch},
    }).waitAndCheck();

    auto storeSrc = findStoreDir(scratch);
    if (!storeSrc)
        throw BadArtifact("downloaded artifact did not contain a store");
    debug("found the downloaded store in '%s'", *storeSrc);

    auto installScript = dirOf(*storeSrc) + "/install";
    if (!pathExists(installScript))
        throw BadArtifact("could not detect store path: '%s' does not exist", installScript);
    auto nixPath = parseInstallScript(readFile(installScript), installer.storeDir);
    debug("the package manager is '%s'", nixPath);

    createDirs(layout.root);

    /* An entry only loses its write bits once it has been copied
       completely, so an interrupted installation may leave writable
       entries that are partial. Those are copied again. */
    auto storeDir = layout.storeDir();
    if (pathExists(storeDir)) {
        chmodPath(storeDir, S_IRWXU);
        for (auto & entry : readDirectory(storeDir)) {
            auto path = storeDir + "/" + entry.name;
            if (!isCompleteStoreEntry(lstat(path))) {
                debug("removing partially installed '%s'", path);
                deletePath(path);
            }
        }
    }

    auto sourceRoot = *storeSrc;
    copyTree(sourceRoot, storeDir, [&](const Path & dir, const StringSet & entries) {
        StringSet skip;
        if (dir != sourceRoot)
            return skip;
        for (auto & name : entries)
            if (maybeLstat(storeDir + "/" + name))
                skip.insert(name);
        return skip;
    });

    auto binLink = layout.binLink();
    if (maybeLstat(binLink))
        deletePath(binLink);
    createSymlink(nixPath + "/bin", binLink);

    Closure closure;
    for (auto & entry : readDirectory(storeDir)) {
        makeReadOnly(storeDir + "/" + entry.name);
        closure.insert(entry.name);
    }

    createDirs(layout.confDir());
    auto nixConf = layout.confDir() + "/nix.conf";
    if (!pathExists(nixConf))
        writeFile(nixConf, defaultNixConf);

    createDirs(layout.stateDir());

    /* Written last: the cache directory marks the installation as done. */
    createDirs(layout.cacheDir());
    writeClosureFile(layout.closureFile(), closure);

    return closure;
}

}
