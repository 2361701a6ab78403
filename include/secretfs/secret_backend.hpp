#pragma once

#include <secretfs/secret.hpp>
#include <string>
#include <vector>

namespace secretfs{

// secret_backend is an abstract base class:  the source of live
// secrets.  In production it's a client of the remote secrets
// service.  In the unit tests it's something that fails, blocks, or
// hands out canned answers.
//
// Both methods return true if and only if they filled in *out with a
// usable answer.  'false' covers not-found, transport errors,
// authentication errors, etc.  Callers don't distinguish them.
//
// Implementations may be slow and may block indefinitely.  Bounding
// the wait is the caller's problem (see secret_cache), not the
// backend's.  They may be called concurrently from many threads.  An
// implementation may throw; secret_cache treats that like 'false'.
struct secret_backend{
    virtual ~secret_backend(){}
    virtual bool fetch_secret(const std::string& name, secret* out) = 0;
    virtual bool fetch_secret_list(std::vector<secret>* out) = 0;
};

} // namespace secretfs
