#include "baseimg/libutil/environment-variables.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/users.hh"

#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <vector>

namespace baseimg {

static std::optional<Path> tryGetHomeOf(uid_t userId)
{
    std::vector<char> buf(16384);
    struct passwd pwbuf;
    struct passwd * pw;
    if (getpwuid_r(userId, &pwbuf, buf.data(), buf.size(), &pw) != 0 || !pw || !pw->pw_dir || !pw->pw_dir[0])
    {
        return std::nullopt;
    }
    return pw->pw_dir;
}

std::optional<Path> tryGetHome()
{
    static std::optional<Path> homeDir = []() {
        auto homeDir = getEnv("HOME");
        if (homeDir) {
            struct stat st;
            if (::stat(homeDir->c_str(), &st) != 0) {
                if (errno != ENOENT)
                    printTaggedWarning(
                        "couldn't stat $HOME ('%s'), falling back to the one defined in the 'passwd' file",
                        *homeDir
                    );
                homeDir.reset();
            } else if (st.st_uid != geteuid()) {
                debug("$HOME ('%s') is not owned by you, using the 'passwd' entry", *homeDir);
                homeDir.reset();
            }
        }
        if (!homeDir)
            homeDir = tryGetHomeOf(geteuid());
        return homeDir;
    }();
    return homeDir;
}

Path getHome()
{
    if (auto home = tryGetHome())
        return std::move(*home);
    throw Error("cannot determine user's home directory");
}

Path getConfigDir()
{
    auto configDir = getEnvNonEmpty("XDG_CONFIG_HOME");
    return configDir ? *configDir : getHome() + "/.config";
}

}
