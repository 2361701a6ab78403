#include "secretfs/log_channel.hpp"
#include "secretfs/strutils.hpp"
#include "secretfs/throwutils.hpp"
#include <stdexcept>
#include <cstdio>
#include <map>
#include <fcntl.h>
#include <unistd.h>
#include <syslog.h>
#include <sys/uio.h>

// Invariant: at most one of dest_syslog and (dest_fd != -1) is true.
// If neither is, send() quietly does nothing.

namespace secretfs{

int syslog_level(const std::string& name){
#define _sl_Enum(n) {std::string(#n), n}
    static const std::map<std::string, int> levels = {
        _sl_Enum(LOG_EMERG),
        _sl_Enum(LOG_ALERT),
        _sl_Enum(LOG_CRIT),
        _sl_Enum(LOG_ERR),
        _sl_Enum(LOG_WARNING),
        _sl_Enum(LOG_NOTICE),
        _sl_Enum(LOG_INFO),
        _sl_Enum(LOG_DEBUG)
    };
#undef _sl_Enum
    auto p = levels.find(name);
    if(p == levels.end())
        throw std::invalid_argument("syslog_level: unrecognized level: " + name);
    return p->second;
}

log_channel::~log_channel(){
    std::lock_guard<std::mutex> lg(mtx);
    if(dest_opened)
        ::close(dest_fd);
}

void log_channel::_close() /* private */{
    if(dest_opened && ::close(dest_fd) != 0){
        dest_fd = -1;
        dest_opened = false;
        throw se(strfunargs("log_channel::close", opened_dest));
    }
    dest_syslog = false;
    dest_lev = 0;
    dest_fd = -1;
    dest_opened = false;
}

void log_channel::open(const std::string& dest, int mode){
    std::lock_guard<std::mutex> lg(mtx);
    _close();
    opened_dest = dest;
    opened_mode = mode;
    if(dest.empty() || dest == "%none"){
        return;
    }else if(startswith(dest, "%syslog")){
        std::string rest = dest.substr(sizeof("%syslog")-1);
        if(rest.empty())
            dest_lev = LOG_NOTICE;
        else if(rest[0] == '%')
            dest_lev = syslog_level(rest.substr(1));
        else
            throw std::runtime_error("log_channel::open: expected %syslog or %syslog%LOG_LEVEL, got: " + dest);
        dest_syslog = true;
    }else if(dest == "%stderr"){
        dest_fd = fileno(stderr);
    }else if(dest == "%stdout"){
        dest_fd = fileno(stdout);
    }else if(dest[0] == '%'){
        throw std::runtime_error("log_channel::open: unrecognized %destination: " + dest);
    }else{
        dest_fd = ::open(dest.c_str(), O_CLOEXEC|O_WRONLY|O_APPEND|O_CREAT, mode);
        if(dest_fd < 0)
            throw se(strfunargs("log_channel::open", dest, fmt("0%o", mode)));
        dest_opened = true;
    }
}

void log_channel::reopen(){
    std::unique_lock<std::mutex> lk(mtx);
    auto dest = opened_dest;
    auto mode = opened_mode;
    lk.unlock();
    open(dest, mode);
}

std::string log_channel::destination() const{
    std::lock_guard<std::mutex> lg(mtx);
    return opened_dest;
}

void log_channel::send(int level, const std::string& rec) const{
    std::lock_guard<std::mutex> lg(mtx);
    if(rec.empty())
        return;
    if(dest_syslog){
        auto lev = (level == -1) ? dest_lev : (level & LOG_PRIMASK);
        ::syslog(LOG_USER | lev, "%.*s", int(rec.size()), rec.data());
    }else if(dest_fd >= 0){
        struct iovec iov[2] = {{const_cast<char*>(rec.data()), rec.size()},
                               {const_cast<char*>("\n"), 1}};
        int iovcnt = rec.back() == '\n' ? 1 : 2;
        // A short or failed write to a log is not worth throwing
        // over.  There's nowhere to report it anyway.
        if(::writev(dest_fd, iov, iovcnt) < 0)
            return;
    }
}

} // namespace secretfs
