#pragma once
///@file

#include "baseimg/libutil/types.hh"
#include "baseimg/libutil/error.hh"
#include "baseimg/libutil/config.hh"

namespace baseimg {

struct LoggerSettings : Config
{
    Setting<bool> showTrace{
        this, false, "show-trace",
        R"(
          Whether to print every context line of an error instead of
          only the first few.
        )"};
};

extern LoggerSettings loggerSettings;

class Logger
{
public:
    virtual ~Logger() { }

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    void log(std::string_view s)
    {
        log(lvlInfo, s);
    }

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    inline void cout(const Args & ... args)
    {
        writeToStdout(fmt(args...));
    }
};

extern Logger * logger;

Logger * makeSimpleLogger();

/**
 * suppress msgs > this
 */
extern Verbosity verbosity;

/**
 * Print a message with the standard ErrorInfo format.
 * In general, use these 'log' macros for reporting problems that may require user
 * intervention or that need more explanation.  Use the 'print' macros for more
 * lightweight status messages.
 */
#define logErrorInfo(level, errorInfo...)                 \
    do {                                                  \
        if ((level) <= ::baseimg::verbosity) {            \
            ::baseimg::logger->logEI((level), errorInfo); \
        }                                                 \
    } while (0)

#define logError(errorInfo...) logErrorInfo(::baseimg::lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(::baseimg::lvlWarn, errorInfo)

/**
 * Print a string message if the current log level is at least the specified
 * level. Note that this has to be implemented as a macro to ensure that the
 * arguments are evaluated lazily.
 */
#define printMsgUsing(loggerParam, level, args...)                               \
    do {                                                                         \
        auto _baseimg_print_lvl = level;                                         \
        if (_baseimg_print_lvl <= ::baseimg::verbosity) {                        \
            loggerParam->log(_baseimg_print_lvl, ::baseimg::HintFmt(args).str()); \
        }                                                                        \
    } while (0)
#define printMsg(level, args...) printMsgUsing(::baseimg::logger, level, args)

#define printWarning(args...) printMsg(::baseimg::lvlWarn, args)
#define printError(args...) printMsg(::baseimg::lvlError, args)
#define notice(args...) printMsg(::baseimg::lvlNotice, args)
#define printInfo(args...) printMsg(::baseimg::lvlInfo, args)
#define printTalkative(args...) printMsg(::baseimg::lvlTalkative, args)
#define debug(args...) printMsg(::baseimg::lvlDebug, args)
#define vomit(args...) printMsg(::baseimg::lvlVomit, args)

#define printTaggedWarning(fs, args...) \
    printWarning(ANSI_WARNING "warning:" ANSI_NORMAL " " fs, ##args)

void writeLogsToStderr(std::string_view s);

}
