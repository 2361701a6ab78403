#pragma once

#include <string>

namespace secretfs{

// log_config - how a secret_cache should identify and verbosify its
// logging.  Neither field has any effect on what gets cached.
//
//   debug: turn on the cache's DIAG output, whether or not the "cache"
//     diag name is set.
//   mountpoint: attached to every record the cache logs, so that
//     several mounts in one log can be told apart.
struct log_config{
    bool debug = false;
    std::string mountpoint;

    // "[/mnt/secrets] " or "" if mountpoint is empty.
    std::string prefix() const{
        return mountpoint.empty() ? std::string() : "[" + mountpoint + "] ";
    }

    // from_env - SecretfsDebug (bool, default false) and
    // SecretfsMountpoint (default empty).
    static log_config from_env();
};

} // namespace secretfs
