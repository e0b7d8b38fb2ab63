#include "baseimg/libimage/globals.hh"
#include "baseimg/libmain/shared.hh"
#include "baseimg/libutil/ansicolor.hh"
#include "baseimg/libutil/config.hh"
#include "baseimg/libutil/exit.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/signals.hh"

#include <iostream>

#include <sys/stat.h>
#include <signal.h>

namespace baseimg {

std::string getArg(const std::string & opt,
    Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end) throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

void initBaseImg()
{
    loadConfFile();

    startSignalHandlerThread();

    /* Reset SIGCHLD to its default. */
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;
    act.sa_handler = SIG_DFL;
    if (sigaction(SIGCHLD, &act, 0))
        throw SysError("resetting SIGCHLD");

    /* The image has to be readable by whoever unpacks it. */
    umask(0022);
}

static bool processCommonFlag(Strings::iterator & pos, const Strings::iterator & end)
{
    auto & arg = *pos;

    if (arg == "--verbose" || arg == "-v")
        verbosity = verbosityFromIntClamped(int(verbosity) + 1);
    else if (arg.size() > 2 && arg[0] == '-' && arg.find_first_not_of('v', 1) == arg.npos)
        verbosity = verbosityFromIntClamped(int(verbosity) + int(arg.size()) - 1);
    else if (arg == "--quiet")
        verbosity = verbosityFromIntClamped(int(verbosity) - 1);
    else if (arg == "--debug")
        verbosity = lvlDebug;
    else if (arg == "--show-trace")
        loggerSettings.showTrace.override(true);
    else if (arg == "--option") {
        auto name = getArg(arg, pos, end);
        auto value = getArg("--option " + name, pos, end);
        globalConfig.set(name, value);
    } else
        return false;

    return true;
}

void parseCmdLine(
    const Strings & args,
    std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg)
{
    Strings ss(args);
    for (auto pos = ss.begin(); pos != ss.end(); ++pos) {
        if (processCommonFlag(pos, ss.end()))
            continue;
        if (!parseArg(pos, ss.end())) {
            if (pos->starts_with("-"))
                throw UsageError("unrecognised flag '%1%'", *pos);
            else
                throw UsageError("unexpected argument '%1%'", *pos);
        }
    }

    globalConfig.warnUnknownSettings();
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% %2%", programName, BASEIMG_VERSION) << std::endl;
    std::cout << "System configuration file: " << settings.systemConfFile << "\n";
    std::cout << "Data directory: " << BASEIMG_DATA_DIR << "\n";
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    try {
        fun();
        return 0;
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1%' for more information.", programName + " --help");
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (const std::bad_alloc & e) {
        printError(ANSI_RED "error:" ANSI_NORMAL " out of memory");
        return 1;
    }
}

}
