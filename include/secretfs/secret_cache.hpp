#pragma once

#include <secretfs/secret.hpp>
#include <secretfs/secret_backend.hpp>
#include <secretfs/timeouts.hpp>
#include <secretfs/log_config.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace secretfs{

// secret_cache - the in-memory secret cache that stands between the
// filesystem and a secret_backend.  All methods are thread-safe.
//
// get_secret(name) - return the named secret, or a null secret_sp if
//   there is none.  An entry younger than timeouts.fresh_threshold is
//   returned without consulting the backend.  Otherwise the backend is
//   asked, with a deadline of timeouts.secret_fetch_timeout.  A timely
//   answer replaces the entry and is returned.  If the backend declines,
//   throws or misses the deadline, the cached entry (of whatever age)
//   is returned, or null if there isn't one.
//
// secret_list() - ask the backend for the full list, with a deadline
//   of timeouts.secret_list_fetch_timeout.  A timely answer replaces
//   the entire contents of the cache and is returned.  Otherwise the
//   current contents are returned unchanged.  Order is unspecified.
//
// add(s) - insert or overwrite s.name's entry.  The backend is not
//   involved.
//
// clear() - remove every entry.
//
// size() - the number of entries.
//
// report_stats(os) - counters, one "name: value" per line.
//
// Backend answers that arrive after their deadline are discarded.
// They never reach the map, so a slow backend can't overwrite a newer
// answer, and a backend that never returns costs a parked thread but
// nothing else.  No lock is held while waiting on the backend, so one
// slow lookup never blocks any other.
//
// The constructor throws std::system_error (EINVAL) if the backend is
// null.  Nothing else throws on account of the backend.
class secret_cache{
public:
    secret_cache(std::shared_ptr<secret_backend> backend, const timeouts& to, const log_config& lc);
    secret_cache(const secret_cache&) = delete;
    secret_cache& operator=(const secret_cache&) = delete;

    secret_sp get_secret(const std::string& name);
    std::vector<secret_sp> secret_list();
    void add(const secret& s);
    void add(secret&& s);
    void clear();
    size_t size() const;

    std::ostream& report_stats(std::ostream& os) const;

    const timeouts& get_timeouts() const { return to; }
    const log_config& get_log_config() const { return logcfg; }

    using clk_t = std::chrono::steady_clock;

private:
    struct entry{
        secret_sp sp;
        clk_t::time_point observed;
    };
    using map_t = std::map<std::string, entry>;

    const std::shared_ptr<secret_backend> backend;
    const timeouts to;
    const log_config logcfg;

    mutable std::mutex mtx;  // protects themap and nothing else
    map_t themap;

    void store(secret_sp sp);
    secret_sp cached(const std::string& name) const;
    std::vector<secret_sp> contents() const;

    struct stats_t{
        std::atomic<unsigned long> secret_requests{0};
        std::atomic<unsigned long> fresh_hits{0};
        std::atomic<unsigned long> backend_answers{0};
        std::atomic<unsigned long> backend_declines{0};
        std::atomic<unsigned long> backend_timeouts{0};
        std::atomic<unsigned long> backend_errors{0};
        std::atomic<unsigned long> fallback_hits{0};
        std::atomic<unsigned long> fallback_misses{0};
        std::atomic<unsigned long> list_requests{0};
        std::atomic<unsigned long> list_replacements{0};
        std::atomic<unsigned long> list_fallbacks{0};
        std::atomic<unsigned long> adds{0};
        std::atomic<unsigned long> clears{0};
    };
    stats_t stats;
};

} // namespace secretfs
