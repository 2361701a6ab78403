#include "secretfs/secret_cache.hpp"
#include "secretfs/complaints.hpp"
#include "secretfs/ut.hpp"
#include "test_backends.hpp"
#include <algorithm>
#include <sstream>
#include <system_error>
#include <thread>

using namespace secretfs;
using namespace std::chrono;

namespace{

// Short deadlines, and nothing is ever fresh.
timeouts quick(){
    return timeouts(nanoseconds(0), milliseconds(10), milliseconds(20));
}

bool has(const std::vector<secret_sp>& v, const secret& s){
    return std::any_of(v.begin(), v.end(), [&](const secret_sp& sp){ return sp && *sp == s; });
}

void test_uses_values_from_backend(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());
    be->push_secret(fixture1());
    auto sp = cache.get_secret(fixture1().name);
    CHECK(sp && *sp == fixture1());
    EQUAL(cache.size(), 1u);
    be->release();
}

void test_passes_through_not_found(){
    auto be = std::make_shared<failing_backend>();
    secret_cache cache(be, quick(), log_config());
    CHECK(!cache.get_secret(fixture1().name));
    EQUAL(cache.size(), 0u);

    cache.add(fixture1());
    auto sp = cache.get_secret(fixture1().name);
    CHECK(sp && *sp == fixture1());
    EQUAL(be->secret_calls.load(), 2);
}

void test_secret_when_backend_times_out(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());

    // Nothing cached, nothing answered.
    CHECK(!cache.get_secret(fixture1().name));

    // A stale entry is better than nothing.
    cache.add(fixture1());
    auto sp = cache.get_secret(fixture1().name);
    CHECK(sp && *sp == fixture1());
    be->release();
}

void test_backend_answer_beats_cache(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());
    auto f2 = fixture2();
    f2.name = fixture1().name;
    cache.add(fixture1());
    be->push_secret(f2);
    auto sp = cache.get_secret(fixture1().name);
    CHECK(sp && *sp == f2);
    EQUAL(cache.size(), 1u);
    // ... and the entry itself was replaced.
    auto contents = cache.secret_list();   // times out
    EQUAL(contents.size(), 1u);
    CHECK(has(contents, f2));
    be->release();
}

void test_fresh_entries_skip_backend(){
    auto be = std::make_shared<channel_backend>();
    auto f2 = fixture2();
    f2.name = fixture1().name;

    secret_cache fresh(be, timeouts(hours(1), milliseconds(10), milliseconds(20)), log_config());
    fresh.add(f2);
    be->push_secret(fixture1());
    for(int i=0; i<2; ++i){
        auto sp = fresh.get_secret(fixture1().name);
        CHECK(sp && *sp == f2);
    }
    EQUAL(be->secret_calls.load(), 0);
    EQUAL(be->pending_secrets(), 1u);

    // With a 1ns threshold, the same entry is stale almost at once.
    secret_cache stale(be, timeouts(nanoseconds(1), milliseconds(100), milliseconds(20)), log_config());
    stale.add(f2);
    std::this_thread::sleep_for(nanoseconds(2));
    auto sp = stale.get_secret(fixture1().name);
    CHECK(sp && *sp == fixture1());
    EQUAL(be->pending_secrets(), 0u);
    auto contents = stale.secret_list();   // times out
    CHECK(has(contents, fixture1()));
    CHECK(!has(contents, f2));
    be->release();
}

void test_stale_entry_survives_failure(){
    auto be = std::make_shared<failing_backend>();
    secret_cache cache(be, quick(), log_config());
    cache.add(fixture1());
    for(int i=0; i<3; ++i){
        auto sp = cache.get_secret(fixture1().name);
        CHECK(sp && *sp == fixture1());
    }
    EQUAL(cache.size(), 1u);
}

void test_list_falls_back_when_backend_fails(){
    auto be = std::make_shared<failing_backend>();
    secret_cache cache(be, quick(), log_config());
    CHECK(cache.secret_list().empty());
    cache.add(fixture1());
    auto l = cache.secret_list();
    EQUAL(l.size(), 1u);
    CHECK(has(l, fixture1()));
}

void test_list_when_backend_times_out(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());
    CHECK(cache.secret_list().empty());
    cache.add(fixture1());
    auto l = cache.secret_list();
    EQUAL(l.size(), 1u);
    CHECK(has(l, fixture1()));
    be->release();
}

void test_list_uses_values_from_backend(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());
    be->push_list({fixture1()});
    auto l = cache.secret_list();
    EQUAL(l.size(), 1u);
    CHECK(has(l, fixture1()));
    EQUAL(cache.size(), 1u);
    be->release();
}

void test_list_replaces_cache(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());
    cache.add(fixture1());
    be->push_list({fixture2()});
    auto l = cache.secret_list();
    EQUAL(l.size(), 1u);
    CHECK(has(l, fixture2()));
    EQUAL(cache.size(), 1u);

    // fixture1 is gone, not merely hidden.
    CHECK(!cache.get_secret(fixture1().name));   // times out
    be->release();
}

void test_list_collapses_duplicate_names(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());
    auto older = named("dup", "b2xkZXI=");   // "older"
    auto newer = named("dup", "bmV3ZXI=");   // "newer"
    be->push_list({older, fixture1(), newer});
    auto l = cache.secret_list();
    EQUAL(l.size(), 2u);
    EQUAL(cache.size(), 2u);
    CHECK(has(l, newer));
    CHECK(!has(l, older));
    be->release();
}

void test_list_with_empty_answer_empties_cache(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());
    cache.add(fixture1());
    be->push_list({});
    CHECK(cache.secret_list().empty());
    EQUAL(cache.size(), 0u);
    be->release();
}

void test_clear(){
    auto be = std::make_shared<failing_backend>();
    secret_cache cache(be, quick(), log_config());
    cache.add(fixture1());
    cache.add(fixture2());
    EQUAL(cache.size(), 2u);
    cache.clear();
    EQUAL(cache.size(), 0u);
    CHECK(!cache.get_secret(fixture1().name));
    cache.clear();   // clearing an empty cache is fine
    EQUAL(cache.size(), 0u);
}

void test_add_never_calls_backend(){
    auto be = std::make_shared<failing_backend>();
    secret_cache cache(be, quick(), log_config());
    cache.add(fixture1());
    auto f2 = fixture2();
    f2.name = fixture1().name;
    cache.add(std::move(f2));   // overwrites
    EQUAL(cache.size(), 1u);
    EQUAL(be->secret_calls.load(), 0);
    EQUAL(be->list_calls.load(), 0);
}

void test_holders_keep_replaced_secrets(){
    auto be = std::make_shared<failing_backend>();
    secret_cache cache(be, quick(), log_config());
    cache.add(fixture1());
    auto before = cache.get_secret(fixture1().name);
    cache.clear();
    CHECK(before && *before == fixture1());
    EQSTR(std::string(before->content.begin(), before->content.end()), "asddas");
}

void test_backend_exception_falls_back(){
    auto be = std::make_shared<throwing_backend>();
    secret_cache cache(be, quick(), log_config());
    CHECK(!cache.get_secret(fixture1().name));
    cache.add(fixture1());
    auto sp = cache.get_secret(fixture1().name);
    CHECK(sp && *sp == fixture1());
    auto l = cache.secret_list();
    EQUAL(l.size(), 1u);
}

void test_wrong_name_is_ignored(){
    auto be = std::make_shared<channel_backend>();
    secret_cache cache(be, quick(), log_config());
    cache.add(fixture1());
    be->push_secret(fixture2());   // asked for fixture1, gets fixture2
    auto sp = cache.get_secret(fixture1().name);
    CHECK(sp && *sp == fixture1());
    EQUAL(cache.size(), 1u);
    be->release();
}

void test_constructor_rejects_bad_arguments(){
    bool threw = false;
    try{
        secret_cache cache(nullptr, quick(), log_config());
    }catch(std::system_error& e){
        threw = (e.code().value() == EINVAL);
    }
    CHECK(threw);

    threw = false;
    try{
        timeouts t(nanoseconds(0), milliseconds(-1), milliseconds(20));
    }catch(std::system_error& e){
        threw = (e.code().value() == EINVAL);
    }
    CHECK(threw);
}

void test_report_stats(){
    auto be = std::make_shared<failing_backend>();
    secret_cache cache(be, timeouts(hours(1), milliseconds(10), milliseconds(20)), log_config());
    cache.add(fixture1());
    cache.get_secret(fixture1().name);
    cache.get_secret(fixture1().name);
    cache.get_secret("no_such_secret");
    cache.secret_list();
    std::ostringstream oss;
    cache.report_stats(oss);
    auto s = oss.str();
    CHECK(s.find("secret_requests: 3\n") != std::string::npos);
    CHECK(s.find("fresh_hits: 2\n") != std::string::npos);
    CHECK(s.find("fallback_misses: 1\n") != std::string::npos);
    CHECK(s.find("list_fallbacks: 1\n") != std::string::npos);
    CHECK(s.find("adds: 1\n") != std::string::npos);
    CHECK(s.find("size: 1\n") != std::string::npos);
}

} // namespace <anon>

int main(int, char **){
    // The timeouts below are deliberate.  Don't let their complaints
    // clutter the output.
    set_complaint_level(LOG_ERR);

    test_uses_values_from_backend();
    test_passes_through_not_found();
    test_secret_when_backend_times_out();
    test_backend_answer_beats_cache();
    test_fresh_entries_skip_backend();
    test_stale_entry_survives_failure();
    test_list_falls_back_when_backend_fails();
    test_list_when_backend_times_out();
    test_list_uses_values_from_backend();
    test_list_replaces_cache();
    test_list_collapses_duplicate_names();
    test_list_with_empty_answer_empties_cache();
    test_clear();
    test_add_never_calls_backend();
    test_holders_keep_replaced_secrets();
    test_backend_exception_falls_back();
    test_wrong_name_is_ignored();
    test_constructor_rejects_bad_arguments();
    test_report_stats();
    return utstatus();
}
