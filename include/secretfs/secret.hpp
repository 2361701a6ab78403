#pragma once

#include <secretfs/sodium_allocator.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <sys/types.h>

namespace secretfs{

// A secret's bytes live in libsodium secure memory.
using content_t = std::vector<unsigned char, sodium_allocator<unsigned char>>;

// secret - one named secret, as delivered by the secrets service.
//
// The cache looks at nothing but 'name'.  Everything else is payload
// that is stored and handed back verbatim.  secrets are values:  two
// secrets with equal fields are interchangeable, and a secret is
// never modified once it's been stored in a cache (see secret_sp).
struct secret{
    std::string name;
    content_t content;
    uint64_t length = 0;     // as declared by the service
    std::chrono::system_clock::time_point created_at{};
    bool is_versioned = false;
    std::string mode;        // octal, e.g., "0400".  May be empty.
    std::string owner;
    std::string group;

    // The st_mode a filesystem should present for this secret:  the
    // permission bits from 'mode' (0440 if mode is empty or isn't
    // valid octal) with S_IFREG.
    mode_t mode_value() const;

    static constexpr mode_t default_mode = 0440;
};

bool operator==(const secret& a, const secret& b);
inline bool operator!=(const secret& a, const secret& b){ return !(a==b); }

// Only the name and size.  We don't print secret bytes, not even in
// diagnostics.
std::ostream& operator<<(std::ostream& os, const secret& s);

// Stored and returned by the cache.  The pointee is const and is
// never modified.  Holders of a secret_sp keep the bytes alive even
// after the cache has replaced or dropped the entry.
using secret_sp = std::shared_ptr<const secret>;

// decode_content - decode base64 (the standard alphabet, with
// padding, ignoring embedded whitespace) directly into secure memory.
// Throws a std::system_error with EINVAL if b64 isn't valid base64.
content_t decode_content(const std::string& b64);

} // namespace secretfs
