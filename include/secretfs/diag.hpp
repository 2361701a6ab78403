#pragma once

// diag - developer diagnostics that cost (almost) nothing when they're
// turned off.
//
//   static auto& _cache = secretfs::diag_name("cache");
//   ...
//   DIAG(_cache, "looking up " << name << " age=" << age.count());
//
// The first argument is any boolean expression.  The second is a
// chain of stream insertions that is *not evaluated* unless the first
// is true.  diag_name returns a reference to a named std::atomic<int>
// that lives for the life of the process, so it's fine to stash it in
// a static.  Names are switched on at runtime:
//
//   secretfs::set_diag_names("cache:bounded_call=2");
//
// or equivalently from the environment, before the first DIAG:
//
//   SECRETFS_DIAG_NAMES=cache:bounded_call=2
//   SECRETFS_DIAG_OPTS=tstamp:tid          (see set_diag_opts)
//   SECRETFS_DIAG_DESTINATION=/tmp/diag.out (see log_channel.hpp)
//
// Boolean expressions can mix names with other state, e.g., a
// per-object debug flag:
//
//   DIAG(_cache || cfg.debug, ...);

#include <secretfs/log_channel.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

#ifdef NODIAG
#define DIAG(BOOL, expr) do{}while(0)
#else
#define DIAG(BOOL, expr) do{                                            \
        if( __builtin_expect(bool(BOOL), 0) ){                          \
            secretfs::diag_t& _td = secretfs::the_diag();               \
            std::lock_guard<std::recursive_mutex> _diag_lg(_td._diag_mtx); \
            _td._diag_before(#BOOL, __FILE__, __LINE__, __func__) << expr; \
            _td._diag_after();                                          \
        }                                                               \
    }while(0)
#endif

namespace secretfs{

struct diag_t{
    std::atomic<int>& diag_name(const std::string& name, int initial_value = 0);

    // set_diag_names: a colon-separated list of name[=level] tokens.
    // A bare name means level 1.
    void set_diag_names(const std::string& names, bool clear_before_set = true);
    // The inverse of set_diag_names.
    std::string get_diag_names(bool showall = false);

    void set_diag_destination(const std::string& dest, int mode = 0666);

    // set_diag_opts: colon-separated option names, optionally
    // prefixed by "no": tstamp, tid, srcfile, func, why.
    void set_diag_opts(const std::string& opts);

    bool opt_tstamp = false;
    bool opt_tid = false;
    bool opt_srcfile = false;
    bool opt_func = true;
    bool opt_why = true;

    // Used by the DIAG macro.  Don't call them directly.
    std::recursive_mutex _diag_mtx;
    std::ostream& _diag_before(const char *why, const char *file, int line, const char *func);
    void _diag_after();

    friend diag_t& the_diag();
private:
    diag_t();
    std::ostringstream os;
    log_channel logchan;
    std::mutex names_mtx;
    // Never deleted, so references handed out by diag_name stay
    // valid through static destruction.
    std::map<std::string, std::atomic<int>>* thenames;
};

diag_t& the_diag();

inline std::atomic<int>& diag_name(const std::string& name, int initial_value = 0){
    return the_diag().diag_name(name, initial_value);
}
inline void set_diag_names(const std::string& names, bool clear_before_set = true){
    the_diag().set_diag_names(names, clear_before_set);
}
inline std::string get_diag_names(bool showall = false){
    return the_diag().get_diag_names(showall);
}
inline void set_diag_destination(const std::string& dest, int mode = 0666){
    the_diag().set_diag_destination(dest, mode);
}
inline void set_diag_opts(const std::string& opts){
    the_diag().set_diag_opts(opts);
}

} // namespace secretfs
