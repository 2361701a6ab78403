// complaints, diag names and the cache's log attribution.  Records go
// to a scratch file which we read back.

#include "secretfs/complaints.hpp"
#include "secretfs/diag.hpp"
#include "secretfs/log_channel.hpp"
#include "secretfs/secret_cache.hpp"
#include "secretfs/ut.hpp"
#include "test_backends.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

using namespace secretfs;
using namespace std::chrono;

static std::string slurp(const std::string& fname){
    std::ifstream ifs(fname);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

static void throws_nested(){
    try{
        throw std::runtime_error("inner\nsecond line");
    }catch(std::exception&){
        std::throw_with_nested(std::runtime_error("outer"));
    }
}

int main(int, char **){
    char tmpl[] = "/tmp/ut_complaints.XXXXXX";
    int fd = ::mkstemp(tmpl);
    CHECK(fd >= 0);
    ::close(fd);
    std::string fname = tmpl;

    set_complaint_destination(fname);
    set_complaint_level(LOG_NOTICE);
    complain(LOG_INFO, "too quiet to be seen");
    complain(LOG_WARNING, "loud enough");
    complain("an error");
    auto s = slurp(fname);
    CHECK(s.find("too quiet") == std::string::npos);
    CHECK(s.find("loud enough") != std::string::npos);
    CHECK(s.find("an error") != std::string::npos);
    CHECK(s.find("W[") != std::string::npos);
    CHECK(s.find("E[") != std::string::npos);
    EQUAL(get_complaint_level(), LOG_NOTICE);

    // Nested exceptions are unwound, outermost first, a record per line.
    try{
        throws_nested();
    }catch(std::exception& e){
        auto whats = exnest_whats(e);
        EQUAL(whats.size(), 2u);
        if(whats.size() == 2){
            EQSTR(whats[0], "outer");
            EQSTR(whats[1], "inner\nsecond line");
        }
        complain(LOG_ERR, e, "while testing");
    }
    s = slurp(fname);
    auto pwhile = s.find("while testing");
    auto pouter = s.find("outer");
    auto pinner = s.find("inner");
    auto psecond = s.find("second line");
    CHECK(pwhile != std::string::npos && pwhile < pouter && pouter < pinner && pinner < psecond && psecond != std::string::npos);

    // The cache puts its mountpoint on what it logs.
    {
        auto be = std::make_shared<channel_backend>();
        log_config lc;
        lc.mountpoint = "/run/ut_secrets";
        secret_cache cache(be, timeouts(nanoseconds(0), milliseconds(10), milliseconds(10)), lc);
        CHECK(!cache.get_secret("anything"));   // times out, at LOG_NOTICE
        be->release();
    }
    s = slurp(fname);
    CHECK(s.find("[/run/ut_secrets] secret_cache: timeout fetching secret anything") != std::string::npos);

    // Log rotation:  move the file aside, reopen, and new records land
    // in a fresh file by the old name.
    std::string rotated = fname + ".1";
    CHECK(::rename(fname.c_str(), rotated.c_str()) == 0);
    complain(LOG_ERR, "before reopen");
    reopen_complaint_destination();
    complain(LOG_ERR, "after reopen");
    CHECK(slurp(rotated).find("before reopen") != std::string::npos);
    CHECK(slurp(rotated).find("after reopen") == std::string::npos);
    CHECK(slurp(fname).find("after reopen") != std::string::npos);
    ::unlink(rotated.c_str());

    // log_channel directly.
    {
        log_channel lc(fname, 0600);
        EQSTR(lc.destination(), fname);
        lc.send("no newline");
        lc.send("has newline\n");
        lc.close();
        EQSTR(lc.destination(), "%none");
        lc.send("dropped");
        s = slurp(fname);
        CHECK(s.find("no newline\nhas newline\n") != std::string::npos);
        CHECK(s.find("dropped") == std::string::npos);
        bool threw = false;
        try{
            lc.open("%bogus");
        }catch(std::runtime_error&){
            threw = true;
        }
        CHECK(threw);
    }

    set_complaint_destination("%none");
    complain(LOG_ERR, "into the void");
    CHECK(slurp(fname).find("into the void") == std::string::npos);

    // diag names
    auto& foo = diag_name("ut_foo");
    EQUAL(foo.load(), 0);
    set_diag_names("ut_foo=3");
    EQUAL(foo.load(), 3);
    CHECK(get_diag_names().find("ut_foo") != std::string::npos);
    set_diag_names("ut_bar");
    EQUAL(foo.load(), 0);
    EQUAL(diag_name("ut_bar").load(), 1);

    // syslog levels
    EQUAL(syslog_level("LOG_WARNING"), LOG_WARNING);
    EQUAL(syslog_level("LOG_DEBUG"), LOG_DEBUG);

    set_complaint_destination("%stderr");
    ::unlink(fname.c_str());
    return utstatus();
}
