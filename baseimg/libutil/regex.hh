#pragma once
///@file

#include "baseimg/libutil/error.hh"

#include <optional>
#include <regex>
#include <string>

namespace baseimg::regex {

class Error : public baseimg::Error
{
public:
    using baseimg::Error::Error;
};

/**
 * Escape every character of `raw` that has a meaning in an ECMAScript
 * regular expression.
 */
std::string quoteRegexChars(const std::string & raw);

/**
 * Compile a regular expression, reporting a malformed one as
 * `regex::Error` instead of `std::regex_error`.
 */
std::regex parse(std::string_view re, std::regex::flag_type flags = std::regex::ECMAScript);

/**
 * Match `re` against the start of every line of `text` in turn.
 *
 * @return the first capture group of the first line that matches, or
 * `std::nullopt` if none does.
 */
std::optional<std::string> firstLineMatch(std::string_view text, const std::regex & re);

}
