// Concurrency:  slow backends, and readers racing list replacement.

#include "secretfs/secret_cache.hpp"
#include "secretfs/complaints.hpp"
#include "secretfs/ut.hpp"
#include "test_backends.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace secretfs;
using namespace std::chrono;

namespace{

// list_backend - answers every list request at once, alternating
// between two lists of the same length with disjoint names.
struct list_backend : public secret_backend{
    std::vector<secret> a, b;
    std::atomic<unsigned> n{0};
    list_backend(){
        for(int i=0; i<50; ++i){
            a.push_back(named("a" + std::to_string(i)));
            b.push_back(named("b" + std::to_string(i)));
        }
    }
    bool fetch_secret(const std::string&, secret*) override{ return false; }
    bool fetch_secret_list(std::vector<secret>* out) override{
        *out = (n++ % 2) ? b : a;
        return true;
    }
};

void test_hung_backend_blocks_nobody_else(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, timeouts(hours(1), milliseconds(500), milliseconds(500)), log_config());
    cache.add(fixture1());

    std::atomic<bool> done{false};
    secret_sp slow;
    std::thread t([&]{ slow = cache.get_secret("nobody_answers"); done = true; });
    // Give t a head start so it's waiting on the backend.
    std::this_thread::sleep_for(milliseconds(50));

    auto t0 = steady_clock::now();
    auto sp = cache.get_secret(fixture1().name);
    cache.add(fixture2());
    auto n = cache.size();
    auto elapsed = steady_clock::now() - t0;
    CHECK(sp && *sp == fixture1());
    EQUAL(n, 2u);
    CHECK(!done);
    CHECK(elapsed < milliseconds(250));

    t.join();
    CHECK(!slow);
    be->release();
}

void test_deadline_is_honored(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, timeouts(nanoseconds(0), milliseconds(50), milliseconds(50)), log_config());
    auto t0 = steady_clock::now();
    CHECK(!cache.get_secret(fixture1().name));
    auto e1 = steady_clock::now() - t0;
    CHECK(e1 >= milliseconds(50));
    CHECK(e1 < seconds(2));

    t0 = steady_clock::now();
    CHECK(cache.secret_list().empty());
    auto e2 = steady_clock::now() - t0;
    CHECK(e2 >= milliseconds(50));
    CHECK(e2 < seconds(2));
    be->release();
}

void test_late_answers_are_discarded(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, timeouts(nanoseconds(0), milliseconds(10), milliseconds(10)), log_config());
    CHECK(!cache.get_secret(fixture1().name));
    CHECK(cache.secret_list().empty());
    // The abandoned calls are still parked in the backend.  Feed
    // them, and let them finish.
    be->push_secret(fixture1());
    be->push_list({fixture1(), fixture2()});
    for(int i=0; i<100 && (be->pending_secrets() || be->pending_lists()); ++i)
        std::this_thread::sleep_for(milliseconds(10));
    EQUAL(be->pending_secrets(), 0u);
    EQUAL(be->pending_lists(), 0u);
    std::this_thread::sleep_for(milliseconds(50));
    EQUAL(cache.size(), 0u);
    be->release();
}

void test_cache_outlives_nothing(){
    // The cache goes away while a call is still parked.  The call
    // owns what it needs, so releasing it afterwards is harmless.
    auto be = std::make_shared<channel_backend>();
    {
        secret_cache cache(be, timeouts(nanoseconds(0), milliseconds(10), milliseconds(10)), log_config());
        CHECK(!cache.get_secret(fixture1().name));
    }
    be->push_secret(fixture1());
    for(int i=0; i<100 && be->pending_secrets(); ++i)
        std::this_thread::sleep_for(milliseconds(10));
    EQUAL(be->pending_secrets(), 0u);
    be->release();
}

void test_readers_see_whole_lists(){
    auto be = std::make_shared<list_backend>();
    secret_cache cache(be, timeouts(hours(1), seconds(5), seconds(5)), log_config());
    for(const auto& s : be->a)
        cache.add(s);

    std::atomic<bool> stop{false};
    std::atomic<unsigned> torn{0};
    std::atomic<unsigned> reads{0};
    std::vector<std::thread> readers;
    for(int r=0; r<4; ++r){
        readers.emplace_back([&]{
            while(!stop){
                if(cache.size() != 50)
                    torn++;
                cache.get_secret((reads % 2) ? "a7" : "b7");
                reads++;
            }
        });
    }
    for(int i=0; i<200; ++i){
        auto l = cache.secret_list();
        if(l.size() != 50)
            torn++;
    }
    stop = true;
    for(auto& t : readers)
        t.join();
    EQUAL(torn.load(), 0u);
    CHECK(reads.load() > 0);
    EQUAL(cache.size(), 50u);
}

} // namespace <anon>

int main(int, char **){
    set_complaint_level(LOG_ERR);
    test_hung_backend_blocks_nobody_else();
    test_deadline_is_honored();
    test_late_answers_are_discarded();
    test_cache_outlives_nothing();
    test_readers_see_whole_lists();
    return utstatus();
}
