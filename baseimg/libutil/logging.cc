#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/environment-variables.hh"
#include "baseimg/libutil/file-descriptor.hh"
#include "baseimg/libutil/terminal.hh"

#include <mutex>
#include <sstream>
#include <unistd.h>

namespace baseimg {

LoggerSettings loggerSettings;

static GlobalConfig::Register rLoggerSettings(&loggerSettings);

Logger * logger = makeSimpleLogger();

void Logger::writeToStdout(std::string_view s)
{
    writeFull(STDOUT_FILENO, filterANSIEscapes(s, !shouldANSI(StandardOutputStream::Stdout)));
    writeFull(STDOUT_FILENO, "\n");
}

class SimpleLogger : public Logger
{
public:

    bool systemd, tty;

    SimpleLogger()
    {
        systemd = getEnv("IN_SYSTEMD") == "1";
        tty = shouldANSI();
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity) return;

        std::string prefix;

        if (systemd) {
            char c;
            switch (lvl) {
            case lvlError: c = '3'; break;
            case lvlWarn: c = '4'; break;
            case lvlNotice: case lvlInfo: c = '5'; break;
            case lvlTalkative: case lvlChatty: c = '6'; break;
            case lvlDebug: case lvlVomit:
            default: c = '7'; break;
            }
            prefix = std::string("<") + c + ">";
        }

        writeLogsToStderr(prefix + filterANSIEscapes(s, !tty) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::stringstream oss;
        showErrorInfo(oss, ei, loggerSettings.showTrace.get());

        log(ei.level, oss.str());
    }
};

Verbosity verbosity = lvlInfo;

Logger * makeSimpleLogger()
{
    return new SimpleLogger();
}

void writeLogsToStderr(std::string_view s)
{
    // never destroyed, other threads may still log during exit
    static auto * lock = new std::mutex;
    std::lock_guard guard(*lock);
    try {
        writeFull(STDERR_FILENO, s, false);
    } catch (SysError & e) {
        /* Ignore failing writes to stderr. We need to ignore write
           errors to ensure that cleanup code that logs to stderr runs
           to completion if the other side of stderr has been closed
           unexpectedly. */
    }
}

}
