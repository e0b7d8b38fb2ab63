#include "baseimg/libutil/error.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/signals.hh"
#include "baseimg/libutil/strings.hh"
#include "baseimg/libutil/terminal.hh"

#include <algorithm>
#include <sstream>

namespace baseimg {

Verbosity verbosityFromIntClamped(int val)
{
    int clamped = std::clamp(val, int(lvlError), int(lvlVomit));
    return static_cast<Verbosity>(clamped);
}

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace { .hint = hint });
}

const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err, loggerSettings.showTrace.get());
        what_ = oss.str();
        return *what_;
    }
}

static std::string indent(std::string_view indentFirst, std::string_view indentRest, std::string_view s)
{
    std::string res;
    bool first = true;

    while (!s.empty()) {
        auto end = s.find('\n');
        if (!first) res += "\n";
        res += chomp(std::string(first ? indentFirst : indentRest) + std::string(s.substr(0, end)));
        first = false;
        if (end == s.npos) break;
        s = s.substr(end + 1);
    }

    return res;
}

static std::string levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error";
    case lvlWarn:
        return ANSI_WARNING "warning";
    case lvlNotice:
        return ANSI_RED "note";
    case lvlInfo:
        return ANSI_GREEN "info";
    case lvlTalkative:
        return ANSI_GREEN "talk";
    case lvlChatty:
        return ANSI_GREEN "chat";
    case lvlDebug:
        return ANSI_WARNING "debug";
    case lvlVomit:
        return ANSI_GREEN "vomit";
    }
    return ANSI_RED "error";
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    auto prefix = levelPrefix(einfo.level) + ":" ANSI_NORMAL " ";

    std::ostringstream oss;

    /* A few traces are always printed; the rest only with --show-trace. */
    if (!einfo.traces.empty()) {
        size_t shown = 0;
        for (auto & trace : einfo.traces) {
            if (!showTrace && shown == 3) {
                oss << "\n" << ANSI_WARNING "(stack trace truncated; use '--show-trace' to show the full trace)" ANSI_NORMAL << "\n";
                break;
            }
            oss << "\n" << "… " << trace.hint.str() << "\n";
            shown++;
        }
        oss << "\n" << prefix;
    }

    oss << einfo.msg << "\n";

    out << indent(prefix, std::string(filterANSIEscapes(prefix, true).size(), ' '), chomp(oss.str()));

    return out;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    /* Destructors must not throw, so printing is the only thing that can
       be done here. */
    try {
        throw;
    } catch (std::exception & e) {
        printMsg(lvl, "error (ignored): %1%", e.what());
    }
}

void ignoreExceptionExceptInterrupt(Verbosity lvl)
{
    try {
        throw;
    } catch (const Interrupted & e) {
        throw;
    } catch (std::exception & e) {
        printMsg(lvl, "error (ignored): %1%", e.what());
    }
}

}
