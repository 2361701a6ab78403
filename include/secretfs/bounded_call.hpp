#pragma once

#include <chrono>
#include <future>
#include <thread>
#include <utility>

// bounded_call - call f(&result) on a thread of its own, and wait no
// longer than 'timeout' for it to finish.
//
//   secret s;
//   auto how = bounded_call([be, name](secret* p){ return be->fetch_secret(name, p); },
//                           std::chrono::milliseconds(10), &s);
//
// Returns:
//   answered  - f returned true in time.  *out holds what f produced.
//   declined  - f returned false in time.  *out is untouched.
//   timed_out - f didn't finish in time.  *out is untouched.
//
// If f throws in time, bounded_call rethrows it.  bounded_call also
// throws std::system_error if the thread can't be started.
//
// After a timeout, nobody waits for f.  It runs to completion (or
// forever) on a detached thread and its result is discarded along
// with the abandoned future.  Therefore f must own everything it
// touches, e.g., by capturing shared_ptrs and copies by value.  It
// must never capture a reference or a 'this' whose lifetime is tied
// to the caller.

namespace secretfs{

enum class call_outcome{ answered, declined, timed_out };

inline const char* to_string(call_outcome o){
    switch(o){
    case call_outcome::answered: return "answered";
    case call_outcome::declined: return "declined";
    case call_outcome::timed_out: return "timed_out";
    }
    return "unknown";
}

template <typename T, typename F, typename Rep, typename Period>
call_outcome
bounded_call(F f, std::chrono::duration<Rep, Period> timeout, T* out){
    std::packaged_task<std::pair<bool, T>()> task(
        [f]() mutable {
            std::pair<bool, T> r{};
            r.first = f(&r.second);
            return r;
        });
    auto fut = task.get_future();
    std::thread(std::move(task)).detach();
    if(fut.wait_for(timeout) != std::future_status::ready)
        return call_outcome::timed_out;
    auto r = fut.get();
    if(!r.first)
        return call_outcome::declined;
    *out = std::move(r.second);
    return call_outcome::answered;
}

} // namespace secretfs
