#pragma once

// log_channel - send individual, pre-formatted records to a
// destination chosen *by name*:
//
//   %none    - discard everything
//   %stdout  - file descriptor 1
//   %stderr  - file descriptor 2
//   %syslog  - syslog(3), facility LOG_USER, level LOG_NOTICE
//   %syslog%LOG_LEVEL  - syslog at the given default level
//   anything else - a file, opened O_WRONLY|O_APPEND|O_CREAT
//
// Records sent to a file descriptor get a trailing newline if they
// don't already have one.  Records sent to syslog don't.
//
// send(), open() and reopen() are thread-safe.  The caller must not
// destroy a log_channel while another thread is using it.

#include <string>
#include <mutex>

namespace secretfs{

struct log_channel{
    log_channel(){}
    log_channel(const std::string& dest, int mode){ open(dest, mode); }
    log_channel(const log_channel&) = delete;
    log_channel& operator=(const log_channel&) = delete;
    ~log_channel();

    void open(const std::string& dest, int mode = 0666);
    void reopen();
    void close(){ open("%none", 0); }

    // level is only consulted for syslog destinations.  -1 means
    // "the level named when the channel was opened".
    void send(int level, const std::string& rec) const;
    void send(const std::string& rec) const { send(-1, rec); }

    std::string destination() const;

private:
    mutable std::mutex mtx;
    bool dest_syslog = false;
    int dest_lev = 0;
    int dest_fd = -1;
    bool dest_opened = false;   // true iff we own dest_fd
    std::string opened_dest;
    int opened_mode = 0;

    void _close();  // mtx must be held
};

// syslog_level - "LOG_WARNING" -> LOG_WARNING, etc.  Throws
// std::invalid_argument for anything that isn't one of the eight
// syslog levels.
int syslog_level(const std::string& name);

} // namespace secretfs
