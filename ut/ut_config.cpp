// Configuration from the environment:  envto, timeouts::from_env and
// log_config::from_env.

#include "secretfs/envto.hpp"
#include "secretfs/timeouts.hpp"
#include "secretfs/log_config.hpp"
#include "secretfs/complaints.hpp"
#include "secretfs/ut.hpp"
#include <cstdlib>
#include <sstream>
#include <system_error>

using namespace secretfs;
using namespace std::chrono;

static void unset_all(){
    ::unsetenv("SecretfsFreshThresholdMs");
    ::unsetenv("SecretfsSecretTimeoutMs");
    ::unsetenv("SecretfsSecretListTimeoutMs");
    ::unsetenv("SecretfsDebug");
    ::unsetenv("SecretfsMountpoint");
}

template <typename F>
static bool throws_einval(F f){
    try{
        f();
    }catch(std::system_error& e){
        return e.code().value() == EINVAL;
    }
    return false;
}

int main(int, char **){
    unset_all();

    // svto
    EQUAL(svto<int>("42"), 42);
    EQUAL(svto<long>(" -7"), -7);
    EQUAL(svto<bool>("yes"), true);
    EQUAL(svto<bool>("off"), false);
    EQUAL(svto<bool>("1"), true);
    EQSTR(svto<std::string>("as is "), "as is ");
    bool threw = false;
    try{ svto<int>("12x"); }catch(std::invalid_argument&){ threw = true; }
    CHECK(threw);

    // envto
    ::setenv("SECRETFS_UT_INT", "17", 1);
    EQUAL(envto<int>("SECRETFS_UT_INT", 3), 17);
    EQUAL(envto<int>("SECRETFS_UT_UNSET", 3), 3);
    ::setenv("SECRETFS_UT_INT", "seventeen", 1);
    CHECK(throws_einval([]{ envto<int>("SECRETFS_UT_INT", 3); }));
    try{
        envto<int>("SECRETFS_UT_INT", 3);
    }catch(std::exception& e){
        auto whats = exnest_whats(e);
        EQUAL(whats.size(), 2u);
        CHECK(whats.size() == 2 && whats[1].find("seventeen") != std::string::npos);
    }

    // timeouts defaults
    auto t = timeouts::from_env();
    CHECK(t.fresh_threshold == milliseconds(1000));
    CHECK(t.secret_fetch_timeout == milliseconds(500));
    CHECK(t.secret_list_fetch_timeout == milliseconds(5000));

    ::setenv("SecretfsFreshThresholdMs", "0", 1);
    ::setenv("SecretfsSecretTimeoutMs", "25", 1);
    ::setenv("SecretfsSecretListTimeoutMs", "250", 1);
    auto t2 = timeouts::from_env();
    CHECK(t2.fresh_threshold == nanoseconds(0));
    CHECK(t2.secret_fetch_timeout == milliseconds(25));
    CHECK(t2.secret_list_fetch_timeout == milliseconds(250));
    std::ostringstream oss;
    oss << t2;
    EQSTR(oss.str(), "fresh_threshold=0s secret_fetch_timeout=0.025s secret_list_fetch_timeout=0.25s");

    ::setenv("SecretfsSecretTimeoutMs", "-1", 1);
    CHECK(throws_einval([]{ timeouts::from_env(); }));
    ::setenv("SecretfsSecretTimeoutMs", "soon", 1);
    CHECK(throws_einval([]{ timeouts::from_env(); }));
    CHECK(throws_einval([]{ timeouts(milliseconds(-1), milliseconds(0), milliseconds(0)); }));
    CHECK(throws_einval([]{ timeouts(milliseconds(0), milliseconds(0), milliseconds(-1)); }));

    // log_config
    auto lc = log_config::from_env();
    CHECK(!lc.debug);
    EQSTR(lc.mountpoint, "");
    EQSTR(lc.prefix(), "");
    ::setenv("SecretfsDebug", "true", 1);
    ::setenv("SecretfsMountpoint", "/run/secrets", 1);
    lc = log_config::from_env();
    CHECK(lc.debug);
    EQSTR(lc.mountpoint, "/run/secrets");
    EQSTR(lc.prefix(), "[/run/secrets] ");

    unset_all();
    return utstatus();
}
