#pragma once
#include <secretfs/throwutils.hpp>
#include <string>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <stdexcept>
#include <exception>

namespace secretfs {

// svto - convert the whole of s to a T, allowing leading and trailing
// whitespace.  Throws std::invalid_argument if the conversion fails or
// if anything but whitespace follows the value.  Integers are read as
// if by "%i", so 0x10, 020 and 16 are all sixteen.
template <typename T>
T svto(const std::string& s){
    std::istringstream iss(s);
    iss.unsetf(std::ios::basefield);
    T ret;
    iss >> ret;
    if(!iss)
        throw std::invalid_argument("svto: could not convert '" + s + "'");
    iss >> std::ws;
    if(!iss.eof())
        throw std::invalid_argument("svto: trailing characters in '" + s + "'");
    return ret;
}

// bool accepts 1/0, true/false, yes/no, on/off.
template <>
inline bool svto<bool>(const std::string& s){
    std::string lc;
    for(auto c : s)
        if(!::isspace((unsigned char)c))
            lc.push_back(::tolower((unsigned char)c));
    if(lc == "1" || lc == "true" || lc == "yes" || lc == "on")
        return true;
    if(lc == "0" || lc == "false" || lc == "no" || lc == "off")
        return false;
    throw std::invalid_argument("svto<bool>: could not convert '" + s + "'");
}

template <>
inline std::string svto<std::string>(const std::string& s){
    return s;
}

// envto - convert the named environment variable to a T, or return
// dflt if it isn't set.  A value that is set but doesn't convert is
// an error, reported with the variable's name attached.
template <typename T>
T envto(const char *name, const T& dflt){
    const char *e = ::getenv(name);
    if(!e)
        return dflt;
    try{
        return svto<T>(e);
    }catch(std::exception&){
        std::throw_with_nested(se(EINVAL, strfunargs("envto", name)));
    }
}

template <typename T>
T envto(const char *name){
    const char *e = ::getenv(name);
    if(!e)
        throw se(EINVAL, strfunargs("envto", name) + ": not set");
    try{
        return svto<T>(e);
    }catch(std::exception&){
        std::throw_with_nested(se(EINVAL, strfunargs("envto", name)));
    }
}

} // namespace secretfs
