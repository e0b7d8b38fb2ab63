#include "baseimg/libutil/regex.hh"
#include "baseimg/libutil/strings.hh"

#include <string>
#include <regex>

namespace baseimg::regex {

std::string quoteRegexChars(const std::string & raw)
{
    static auto specialRegex = parse(R"([.^$\\*+?()\[\]{}|])");
    return std::regex_replace(raw, specialRegex, R"(\$&)");
}

std::regex parse(std::string_view re, std::regex::flag_type flags)
try {
    return std::regex(re.begin(), re.end(), flags);
} catch (std::regex_error & e) {
    if (e.code() == std::regex_constants::error_space) {
        // limit is _GLIBCXX_REGEX_STATE_LIMIT for libstdc++
        throw Error("memory limit exceeded by regular expression '%s'", re);
    } else {
        throw Error("invalid regular expression '%s': %s", re, e.what());
    }
}

std::optional<std::string> firstLineMatch(std::string_view text, const std::regex & re)
{
    while (!text.empty()) {
        auto [line, rest] = getLine(text);
        std::match_results<std::string_view::const_iterator> match;
        if (std::regex_search(line.begin(), line.end(), match, re, std::regex_constants::match_continuous)
            && match.size() > 1)
            return match[1].str();
        text = rest;
    }
    return std::nullopt;
}

}
