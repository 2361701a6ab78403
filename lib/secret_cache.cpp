#include "secretfs/secret_cache.hpp"
#include "secretfs/bounded_call.hpp"
#include "secretfs/complaints.hpp"
#include "secretfs/diag.hpp"
#include "secretfs/strutils.hpp"
#include "secretfs/throwutils.hpp"
#include <utility>

using namespace std::chrono;

namespace secretfs{

static auto& _cache = diag_name("cache");

secret_cache::secret_cache(std::shared_ptr<secret_backend> backend_, const timeouts& to_, const log_config& lc) :
    backend(std::move(backend_)),
    to(to_),
    logcfg(lc)
{
    if(!backend)
        throw se(EINVAL, logcfg.prefix() + "secret_cache: backend must not be null");
    DIAG(_cache || logcfg.debug, logcfg.prefix() << "secret_cache created: " << to);
}

secret_sp
secret_cache::get_secret(const std::string& name){
    stats.secret_requests++;
    {
        std::lock_guard<std::mutex> lg(mtx);
        auto p = themap.find(name);
        if(p != themap.end()){
            auto age = clk_t::now() - p->second.observed;
            if(age < to.fresh_threshold){
                stats.fresh_hits++;
                DIAG(_cache || logcfg.debug, logcfg.prefix() << "fresh hit: " << name << " age=" << duration_cast<microseconds>(age).count() << "us");
                return p->second.sp;
            }
        }
    }

    // Copies, not references.  The call may outlive this frame, and
    // even *this.
    auto be = backend;
    auto fetch = [be, name](secret* out){ return be->fetch_secret(name, out); };
    secret fetched;
    call_outcome how;
    try{
        how = bounded_call(fetch, to.secret_fetch_timeout, &fetched);
    }catch(std::exception& e){
        stats.backend_errors++;
        complain(LOG_WARNING, e, logcfg.prefix() + "secret_cache: backend error fetching secret " + name);
        how = call_outcome::declined;
    }

    switch(how){
    case call_outcome::answered:
        if(fetched.name == name){
            stats.backend_answers++;
            auto sp = std::make_shared<const secret>(std::move(fetched));
            store(sp);
            DIAG(_cache || logcfg.debug, logcfg.prefix() << "backend answered: " << *sp);
            return sp;
        }
        // Storing it under 'name' would break the key/name invariant.
        stats.backend_errors++;
        complain(LOG_WARNING, logcfg.prefix() + "secret_cache: asked backend for " + name + " but got " + fetched.name + ".  Ignoring it.");
        break;
    case call_outcome::declined:
        stats.backend_declines++;
        DIAG(_cache || logcfg.debug, logcfg.prefix() << "backend declined: " << name);
        break;
    case call_outcome::timed_out:
        stats.backend_timeouts++;
        complain(LOG_NOTICE, logcfg.prefix() + "secret_cache: timeout fetching secret " + name
                 + fmt(" after %.3fs", duration<double>(to.secret_fetch_timeout).count()));
        break;
    }

    auto ret = cached(name);
    if(ret)
        stats.fallback_hits++;
    else
        stats.fallback_misses++;
    DIAG(_cache || logcfg.debug, logcfg.prefix() << "fallback for " << name << ": " << (ret ? "cached" : "not found"));
    return ret;
}

std::vector<secret_sp>
secret_cache::secret_list(){
    stats.list_requests++;
    auto be = backend;
    auto fetch = [be](std::vector<secret>* out){ return be->fetch_secret_list(out); };
    std::vector<secret> fetched;
    call_outcome how;
    try{
        how = bounded_call(fetch, to.secret_list_fetch_timeout, &fetched);
    }catch(std::exception& e){
        stats.backend_errors++;
        complain(LOG_WARNING, e, logcfg.prefix() + "secret_cache: backend error fetching secret list");
        how = call_outcome::declined;
    }

    if(how != call_outcome::answered){
        stats.list_fallbacks++;
        if(how == call_outcome::timed_out){
            stats.backend_timeouts++;
            complain(LOG_NOTICE, logcfg.prefix() + "secret_cache: timeout fetching secret list"
                     + fmt(" after %.3fs", duration<double>(to.secret_list_fetch_timeout).count()));
        }else{
            stats.backend_declines++;
        }
        auto ret = contents();
        DIAG(_cache || logcfg.debug, logcfg.prefix() << "list " << to_string(how) << ", returning " << ret.size() << " cached secrets");
        return ret;
    }

    // Build the replacement without the lock.  Swap it in with the
    // lock.  Destroy the old one without the lock.  Readers see all
    // of the old map or all of the new one.
    stats.backend_answers++;
    stats.list_replacements++;
    map_t newmap;
    std::vector<secret_sp> ret;
    auto now = clk_t::now();
    for(auto& s : fetched){
        auto sp = std::make_shared<const secret>(std::move(s));
        newmap[sp->name] = entry{sp, now};
    }
    ret.reserve(newmap.size());
    for(const auto& kv : newmap)
        ret.push_back(kv.second.sp);
    if(ret.size() != fetched.size())
        DIAG(_cache || logcfg.debug, logcfg.prefix() << "backend list had " << fetched.size() - ret.size() << " duplicate names");
    {
        std::lock_guard<std::mutex> lg(mtx);
        themap.swap(newmap);
    }
    DIAG(_cache || logcfg.debug, logcfg.prefix() << "list replaced: " << ret.size() << " secrets, " << newmap.size() << " before");
    return ret;
}

void
secret_cache::add(const secret& s){
    add(secret(s));
}

void
secret_cache::add(secret&& s){
    stats.adds++;
    auto sp = std::make_shared<const secret>(std::move(s));
    DIAG(_cache || logcfg.debug, logcfg.prefix() << "add: " << *sp);
    store(std::move(sp));
}

void
secret_cache::clear(){
    stats.clears++;
    map_t doomed;
    {
        std::lock_guard<std::mutex> lg(mtx);
        themap.swap(doomed);
    }
    DIAG(_cache || logcfg.debug, logcfg.prefix() << "cleared " << doomed.size() << " secrets");
}

size_t
secret_cache::size() const{
    std::lock_guard<std::mutex> lg(mtx);
    return themap.size();
}

void
secret_cache::store(secret_sp sp) /*private*/{
    auto now = clk_t::now();
    secret_sp doomed;
    std::lock_guard<std::mutex> lg(mtx);
    auto& e = themap[sp->name];
    // The old secret, if any, is freed after the lock is released.
    doomed = std::move(e.sp);
    e.sp = std::move(sp);
    e.observed = now;
}

secret_sp
secret_cache::cached(const std::string& name) const /*private*/{
    std::lock_guard<std::mutex> lg(mtx);
    auto p = themap.find(name);
    return (p == themap.end()) ? secret_sp() : p->second.sp;
}

std::vector<secret_sp>
secret_cache::contents() const /*private*/{
    std::vector<secret_sp> ret;
    std::lock_guard<std::mutex> lg(mtx);
    ret.reserve(themap.size());
    for(const auto& kv : themap)
        ret.push_back(kv.second.sp);
    return ret;
}

std::ostream&
secret_cache::report_stats(std::ostream& os) const{
    return os << "secret_requests: " << stats.secret_requests.load() << "\n"
              << "fresh_hits: " << stats.fresh_hits.load() << "\n"
              << "backend_answers: " << stats.backend_answers.load() << "\n"
              << "backend_declines: " << stats.backend_declines.load() << "\n"
              << "backend_timeouts: " << stats.backend_timeouts.load() << "\n"
              << "backend_errors: " << stats.backend_errors.load() << "\n"
              << "fallback_hits: " << stats.fallback_hits.load() << "\n"
              << "fallback_misses: " << stats.fallback_misses.load() << "\n"
              << "list_requests: " << stats.list_requests.load() << "\n"
              << "list_replacements: " << stats.list_replacements.load() << "\n"
              << "list_fallbacks: " << stats.list_fallbacks.load() << "\n"
              << "adds: " << stats.adds.load() << "\n"
              << "clears: " << stats.clears.load() << "\n"
              << "size: " << size() << "\n";
}

} // namespace secretfs
