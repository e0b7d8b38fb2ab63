#include "baseimg/libutil/terminal.hh"
#include "baseimg/libutil/environment-variables.hh"

#include <unistd.h>

namespace baseimg {

static bool isOutputARealTerminal(StandardOutputStream fileno)
{
    return isatty(int(fileno)) && getEnv("TERM").value_or("dumb") != "dumb";
}

bool shouldANSI(StandardOutputStream fileno)
{
    auto compute = [](StandardOutputStream fileno) -> bool {
        bool mustNotColour = getEnv("NO_COLOR").has_value() || getEnv("NOCOLOR").has_value();
        bool shouldForce = getEnv("CLICOLOR_FORCE").has_value() || getEnv("FORCE_COLOR").has_value();
        return !mustNotColour && (shouldForce || isOutputARealTerminal(fileno));
    };
    static bool cached[2] = {compute(StandardOutputStream::Stdout), compute(StandardOutputStream::Stderr)};
    return cached[int(fileno) - 1];
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string t;
    auto i = s.begin();

    while (i != s.end()) {
        if (*i != '\e') {
            t += *i++;
            continue;
        }

        std::string e;
        e += *i++;

        if (i != s.end() && *i == '[') {
            e += *i++;
            char last = 0;
            // CSI parameters, then a terminator in 0x40-0x7e
            while (i != s.end() && *i >= 0x20 && *i <= 0x3f) e += *i++;
            if (i != s.end() && *i >= 0x40 && *i <= 0x7e) e += last = *i++;
            if (!filterAll && last == 'm')
                t += e;
        } else if (i != s.end() && *i == ']') {
            // OSC, terminated by ST or BEL
            i++;
            while (i != s.end()) {
                if (*i == '\a') { i++; break; }
                if (*i == '\e' && i + 1 != s.end() && *(i + 1) == '\\') { i += 2; break; }
                i++;
            }
        } else if (i != s.end() && *i >= 0x40 && *i <= 0x5f) {
            i++;
        }
    }

    return t;
}

}
