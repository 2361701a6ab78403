#include "secretfs/bounded_call.hpp"
#include "secretfs/ut.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace secretfs;
using namespace std::chrono;

int main(int, char **){
    std::string out = "untouched";

    EQSTR(to_string(bounded_call([](std::string* p){ *p = "hello"; return true; }, milliseconds(1000), &out)), "answered");
    EQSTR(out, "hello");

    out = "untouched";
    EQSTR(to_string(bounded_call([](std::string* p){ *p = "ignored"; return false; }, milliseconds(1000), &out)), "declined");
    EQSTR(out, "untouched");

    bool threw = false;
    try{
        bounded_call([](std::string*) -> bool { throw std::runtime_error("oops"); }, milliseconds(1000), &out);
    }catch(std::runtime_error& e){
        threw = (std::string(e.what()) == "oops");
    }
    CHECK(threw);
    EQSTR(out, "untouched");

    // A slow call times out, and when it eventually finishes its
    // result goes nowhere.
    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto t0 = steady_clock::now();
    auto how = bounded_call([finished](std::string* p){
            std::this_thread::sleep_for(milliseconds(100));
            *p = "too late";
            *finished = true;
            return true;
        }, milliseconds(10), &out);
    auto elapsed = steady_clock::now() - t0;
    EQSTR(to_string(how), "timed_out");
    CHECK(elapsed < milliseconds(100));
    for(int i=0; i<100 && !*finished; ++i)
        std::this_thread::sleep_for(milliseconds(10));
    CHECK(*finished);
    EQSTR(out, "untouched");

    // A zero timeout is allowed.  Whether it's answered or timed_out
    // depends on the scheduler, but it's never declined.
    how = bounded_call([](std::string* p){ *p = "fast"; return true; }, nanoseconds(0), &out);
    CHECK(how != call_outcome::declined);

    return utstatus();
}
