#pragma once

#include <chrono>
#include <ostream>

namespace secretfs{

// timeouts - the three durations that govern a secret_cache.
//
//   fresh_threshold: a cached entry younger than this is returned
//     without asking the backend.  Zero means "always ask".
//   secret_fetch_timeout: how long get_secret waits for the backend.
//   secret_list_fetch_timeout: how long secret_list waits for the backend.
//
// All three must be non-negative.  The constructor throws a
// std::system_error (EINVAL) otherwise.
struct timeouts{
    using duration = std::chrono::nanoseconds;
    const duration fresh_threshold;
    const duration secret_fetch_timeout;
    const duration secret_list_fetch_timeout;

    timeouts(duration fresh, duration secret_fetch, duration secret_list_fetch);

    // from_env - read the three durations, in milliseconds, from:
    //   SecretfsFreshThresholdMs      (default 1000)
    //   SecretfsSecretTimeoutMs       (default 500)
    //   SecretfsSecretListTimeoutMs   (default 5000)
    static timeouts from_env();
};

std::ostream& operator<<(std::ostream& os, const timeouts& t);

} // namespace secretfs
