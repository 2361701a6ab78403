#include "secretfs/log_config.hpp"
#include "secretfs/envto.hpp"

namespace secretfs{

log_config
log_config::from_env() /*static*/ {
    log_config ret;
    ret.debug = envto<bool>("SecretfsDebug", false);
    ret.mountpoint = envto<std::string>("SecretfsMountpoint", "");
    return ret;
}

} // namespace secretfs
