#pragma once
// A handful of string helpers used by the logging and error-reporting
// code.  Nothing here knows anything about secrets.

#include <string>
#include <sstream>
#include <memory>
#include <stdexcept>
#include <cstdarg>
#include <cstdio>

namespace secretfs {

inline bool startswith(const std::string& s, const std::string& pfx){
    return s.size() >= pfx.size() && s.compare(0, pfx.size(), pfx) == 0;
}

// str_sep, str - stream-insert all the arguments into a string,
//   separated by sep (or a single space):
//
//     str("name=", name, "age=", dur.count())
//
inline void _ins_sep(std::ostream&, const char *){}

template <typename T, typename ... Rest>
void _ins_sep(std::ostream& os, const char *sep, const T& first, const Rest& ... rest){
    os << first;
    if(sizeof...(rest))
        os << sep;
    _ins_sep(os, sep, rest...);
}

template <typename ... Types>
std::string
str_sep(const char *sep, Types const& ... values){
    std::ostringstream oss;
    _ins_sep(oss, sep, values...);
    return oss.str();
}

template <typename ... Types>
std::string
str(Types const& ... values){
    return str_sep(" ", values...);
}

// fmt, vfmt - printf-style formatting into a std::string.
inline std::string
vfmt(const char *fmt, va_list va){
    size_t plen = 256;
    for(int tries=0; tries<2; ++tries){
        std::unique_ptr<char[]> p(new char[plen]);
        va_list ap;
        va_copy(ap, va);
        auto n = vsnprintf(p.get(), plen, fmt, ap);
        va_end(ap);
        if(n<0)
            throw std::runtime_error("vfmt: vsnprintf returned negative");
        if(size_t(n) < plen)
            return {p.get(), size_t(n)};
        plen = n+1;
    }
    throw std::runtime_error("vfmt: vsnprintf changed its mind about how much space it needs");
}

inline std::string fmt(const char *fmt, ...)
    __attribute__ ((__format__ (__printf__, 1, 2)));
inline std::string fmt(const char *fmt, ...){
    va_list ap;
    va_start(ap, fmt);
    auto ret = vfmt(fmt, ap);
    va_end(ap);
    return ret;
}

} // namespace secretfs
