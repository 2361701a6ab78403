#include "secretfs/timeouts.hpp"
#include "secretfs/envto.hpp"
#include "secretfs/throwutils.hpp"

using namespace std::chrono;

namespace secretfs{

timeouts::timeouts(duration fresh, duration secret_fetch, duration secret_list_fetch) :
    fresh_threshold(fresh),
    secret_fetch_timeout(secret_fetch),
    secret_list_fetch_timeout(secret_list_fetch)
{
    if(fresh_threshold.count() < 0 || secret_fetch_timeout.count() < 0 || secret_list_fetch_timeout.count() < 0)
        throw se(EINVAL, str("timeouts: durations must be non-negative:", *this));
}

timeouts
timeouts::from_env() /*static*/ {
    return timeouts(milliseconds(envto<long>("SecretfsFreshThresholdMs", 1000L)),
                    milliseconds(envto<long>("SecretfsSecretTimeoutMs", 500L)),
                    milliseconds(envto<long>("SecretfsSecretListTimeoutMs", 5000L)));
}

std::ostream& operator<<(std::ostream& os, const timeouts& t){
    return os << "fresh_threshold=" << duration_cast<duration<double>>(t.fresh_threshold).count() << "s"
              << " secret_fetch_timeout=" << duration_cast<duration<double>>(t.secret_fetch_timeout).count() << "s"
              << " secret_list_fetch_timeout=" << duration_cast<duration<double>>(t.secret_list_fetch_timeout).count() << "s";
}

} // namespace secretfs
