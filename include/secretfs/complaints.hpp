#pragma once

#include <exception>
#include <string>
#include <vector>
#include <syslog.h>

// complaints - the operational log.  Use one of:
//
//   complain(msg)                      // at LOG_ERR
//   complain(priority, msg)
//   complain(exception, msg)           // at LOG_ERR
//   complain(priority, exception, msg)
//
// Priorities are syslog levels (LOG_WARNING, LOG_NOTICE, ...).
//
// When an exception is supplied, it is "un-nested" (see
// std::throw_with_nested), and every line of every what() is logged
// as a separate record.  Each record is prefixed with
//
//     L[seq.subseq]
//
// where L is one of emerG, Alert, Crit, Err, Warning, Notice, Info or
// Debug, seq is a process-wide sequence number and subseq numbers the
// lines of a multi-part complaint.  Records from concurrent threads
// can be untangled by seq.
//
// set_complaint_level(LOG_NOTICE) discards anything less severe than
// LOG_NOTICE before any formatting or unnesting is done, so a
// complain(LOG_DEBUG, ...) that's turned off costs very little.  The
// default level is LOG_INFO.
//
// If the diag name "complaints" is set, everything that passes the
// level check is also copied to the diag stream.
//
// All functions are thread-safe.

namespace secretfs{

void complain(int priority, const std::string& msg);
void complain(int priority, const std::exception& e, const std::string& msg);

inline void complain(const std::string& msg){
    complain(LOG_ERR, msg);
}

inline void complain(const std::exception& e, const std::string& msg){
    complain(LOG_ERR, e, msg);
}

void set_complaint_level(int level);
int get_complaint_level();

// See log_channel.hpp for the destination syntax.  The default is
// %stderr.
void set_complaint_destination(const std::string& dest, int mode = 0666);
void reopen_complaint_destination();

// The what() strings of e and everything nested inside it, outermost
// first.
std::vector<std::string> exnest_whats(const std::exception& e);

} // namespace secretfs
