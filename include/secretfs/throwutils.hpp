#pragma once

#include <secretfs/strutils.hpp>
#include <system_error>
#include <string>
#include <errno.h>

namespace secretfs {

// se - shorthand for constructing a std::system_error:
//
//     throw se(EINVAL, strfunargs(__func__, name) + ": backend must not be null");
//
inline std::system_error se(int eno, const std::string& msg){
    return std::system_error(eno, std::system_category(), msg);
}

inline std::system_error se(const std::string& msg){
    return se(errno, msg);
}

// strfunargs - a string that looks like a function call, for
// what() strings:  strfunargs("envto", "SecretfsDebug") -> envto(SecretfsDebug)
template <typename ... Args>
std::string
strfunargs(const std::string& name, Args ... args){
    return name + "(" + str_sep(", ", args...) + ")";
}

} // namespace secretfs
