#pragma once
///@file

#include <iostream>
#include <string>
#include <boost/format.hpp>
#include "baseimg/libutil/ansicolor.hh"

// Explicit instantiation in fmt.cc
extern template class boost::basic_format<char>;

namespace baseimg {

/**
 * Values wrapped in this struct are printed in magenta.
 *
 * By default, arguments to `HintFmt` are printed in magenta. To avoid this,
 * wrap the argument in `Uncolored`.
 */
template<class T>
struct Magenta
{
    Magenta(const T & s) : value(s) {}
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & y)
{
    return out << ANSI_MAGENTA << y.value << ANSI_NORMAL;
}

/**
 * Values wrapped in this class are printed without coloring.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & s) : value(s) {}
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Uncolored<T> & y)
{
    return out << ANSI_NORMAL << y.value;
}

namespace fmt_internal {

inline void setExceptions(boost::format & fmt)
{
    fmt.exceptions(
        boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit
    );
}

/**
 * Feeds arguments into a `boost::format`, coloring everything that is
 * not explicitly `Uncolored`.
 */
struct ColoringFeeder
{
    boost::format fmt;

    template<typename... Args>
    ColoringFeeder(boost::format && f, const Args &... args) : fmt(std::move(f))
    {
        setExceptions(fmt);
        (*this % ... % args);
    }

    template<class T>
    ColoringFeeder & operator%(const T & value)
    {
        fmt % Magenta(value);
        return *this;
    }

    template<class T>
    ColoringFeeder & operator%(const Uncolored<T> & value)
    {
        fmt % value.value;
        return *this;
    }

    boost::format release()
    {
        return std::move(fmt);
    }
};

}

/**
 * Write a `boost::format` expression to a string. With a single
 * argument the string is returned unchanged, so user-supplied text
 * containing `%` can never be mistaken for a format string.
 */
inline std::string fmt(const std::string & s)
{
    return s;
}

inline std::string fmt(const char * s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
try {
    boost::format f(fs);
    fmt_internal::setExceptions(f);
    (f % ... % args);
    return f.str();
} catch (boost::io::format_error & fe) {
    std::cerr << "baseimg::fmt threw format error. Original format string: '";
    std::cerr << fs << "'; number of arguments: " << sizeof...(args) << "\n";
    std::terminate();
}

/**
 * A wrapper around `boost::format` which colors interpolated arguments in
 * magenta by default.
 */
class HintFmt
{
private:
    boost::format fmt;

public:
    /**
     * Format the given string literally, without interpolating format
     * placeholders.
     */
    HintFmt(const std::string & literal);

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        try : fmt(fmt_internal::ColoringFeeder(boost::format(format), args...).release())
    {
        if (this->fmt.remaining_args() != 0) {
            std::cerr << "HintFmt received incorrect number of format args. Original format string: '";
            std::cerr << format << "'; number of arguments: " << sizeof...(args) << "\n";
            std::terminate();
        }
    } catch (boost::io::format_error & ex) {
        std::cerr << "HintFmt received incorrect format string. Original format string: '";
        std::cerr << format << "'; number of arguments: " << sizeof...(args) << "\n";
        std::terminate();
    }

    HintFmt(const HintFmt & hf) : fmt(hf.fmt) {}

    HintFmt & operator=(HintFmt const & rhs) = default;

    std::string str() const
    {
        return fmt.str();
    }
};

// Explicit instantiations in fmt.cc
extern template HintFmt::HintFmt(const std::string &, const Uncolored<std::string> &s);
extern template HintFmt::HintFmt(const std::string &, const std::string &s);

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

}
