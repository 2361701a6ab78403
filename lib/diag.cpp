#include "secretfs/diag.hpp"
#include "secretfs/strutils.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <tuple>
#include <ctime>
#include <unistd.h>
#include <sys/syscall.h>

namespace secretfs{

diag_t& the_diag(){
    static diag_t the;
    return the;
}

diag_t::diag_t() :
    logchan("%stderr", 0),
    thenames(new std::map<std::string, std::atomic<int>>)
{
    // A bad environment shouldn't stop the program, but it
    // shouldn't go unnoticed either.
    const char *p;
    try{
        set_diag_names((p=::getenv("SECRETFS_DIAG_NAMES")) ? p : "");
        set_diag_opts((p=::getenv("SECRETFS_DIAG_OPTS")) ? p : "");
        set_diag_destination((p=::getenv("SECRETFS_DIAG_DESTINATION")) ? p : "%stderr");
    }catch(std::exception& e){
        std::cerr << "WARNING: error initializing diagnostics from the environment: " << e.what() << std::endl;
    }
}

std::atomic<int>& diag_t::diag_name(const std::string& name, int initial_value){
    if(name.empty())
        throw std::invalid_argument("diag_name: name must be non-empty");
    std::lock_guard<std::mutex> lg(names_mtx);
    auto p = thenames->find(name);
    if(p != thenames->end())
        return p->second;
    return thenames->emplace(std::piecewise_construct,
                             std::forward_as_tuple(name),
                             std::forward_as_tuple(initial_value)).first->second;
}

void diag_t::set_diag_names(const std::string& names, bool clear_before_set){
    if(clear_before_set){
        std::lock_guard<std::mutex> lg(names_mtx);
        for(auto& kv : *thenames)
            kv.second = 0;
    }
    std::string::size_type start = 0;
    while(start < names.size()){
        auto colon = names.find(':', start);
        if(colon == std::string::npos)
            colon = names.size();
        std::string tok = names.substr(start, colon-start);
        start = colon+1;
        if(tok.empty())
            continue;
        int lev = 1;
        auto eq = tok.find('=');
        if(eq != std::string::npos){
            // Garbage after the '=' leaves the level at 1.
            std::sscanf(tok.c_str()+eq+1, "%d", &lev);
            tok.resize(eq);
        }
        diag_name(tok) = lev;
    }
}

std::string diag_t::get_diag_names(bool showall){
    std::lock_guard<std::mutex> lg(names_mtx);
    std::ostringstream oss;
    const char *sep = "";
    for(const auto& kv : *thenames){
        if(showall || kv.second != 0){
            oss << sep << kv.first << "=" << kv.second.load();
            sep = ":";
        }
    }
    return oss.str();
}

void diag_t::set_diag_destination(const std::string& dest, int mode){
    std::lock_guard<std::recursive_mutex> lk(_diag_mtx);
    logchan.open(dest, mode);
}

void diag_t::set_diag_opts(const std::string& opts){
    std::lock_guard<std::recursive_mutex> lk(_diag_mtx);
    opt_tstamp = false;
    opt_tid = false;
    opt_srcfile = false;
    opt_func = true;
    opt_why = true;
    std::string::size_type start = 0;
    while(start < opts.size()){
        auto colon = opts.find(':', start);
        if(colon == std::string::npos)
            colon = opts.size();
        std::string tok = opts.substr(start, colon-start);
        start = colon+1;
        bool negate = startswith(tok, "no");
        if(negate)
            tok = tok.substr(2);
        if(tok == "tstamp")
            opt_tstamp = !negate;
        else if(tok == "tid")
            opt_tid = !negate;
        else if(tok == "srcfile")
            opt_srcfile = !negate;
        else if(tok == "func")
            opt_func = !negate;
        else if(tok == "why")
            opt_why = !negate;
    }
}

std::ostream& diag_t::_diag_before(const char *why, const char *file, int line, const char *func){
    if(opt_tstamp){
        using namespace std::chrono;
        auto now_musec = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
        time_t now_timet = now_musec/1000000;
        struct tm now_tm;
        if(::localtime_r(&now_timet, &now_tm)){
            auto oldfill = os.fill('0');
            os << std::setw(2) << now_tm.tm_hour << ':' << std::setw(2) << now_tm.tm_min << ':'
               << std::setw(2) << now_tm.tm_sec << '.' << std::setw(6) << now_musec%1000000 << ' ';
            os.fill(oldfill);
        }
    }
    if(opt_tid)
        os << '[' << ::syscall(SYS_gettid) << "] ";
    if(opt_srcfile){
        const char *slash = ::strrchr(file, '/');
        os << (slash ? slash+1 : file) << ':' << line << ' ';
    }
    if(opt_func)
        os << func << "() ";
    if(opt_why)
        os << "[" << why << "] ";
    return os;
}

void diag_t::_diag_after(){
    logchan.send(os.str());
    os.str(std::string());
    os.clear();
}

} // namespace secretfs
