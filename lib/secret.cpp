#include "secretfs/secret.hpp"
#include "secretfs/complaints.hpp"
#include "secretfs/strutils.hpp"
#include "secretfs/throwutils.hpp"
#include <sodium.h>
#include <cerrno>
#include <cstdlib>
#include <sys/stat.h>

namespace secretfs{

mode_t
secret::mode_value() const{
    mode_t perms = default_mode;
    if(!mode.empty()){
        char *end;
        errno = 0;
        auto v = ::strtoul(mode.c_str(), &end, 8);
        if(errno == 0 && end != mode.c_str() && *end == '\0' && v <= 07777)
            perms = mode_t(v);
        else
            complain(LOG_WARNING, "secret " + name + ": mode '" + mode + "' is not octal.  Using " + fmt("0%o", unsigned(default_mode)));
    }
    return perms | S_IFREG;
}

bool operator==(const secret& a, const secret& b){
    return a.name == b.name &&
        a.content == b.content &&
        a.length == b.length &&
        a.created_at == b.created_at &&
        a.is_versioned == b.is_versioned &&
        a.mode == b.mode &&
        a.owner == b.owner &&
        a.group == b.group;
}

std::ostream& operator<<(std::ostream& os, const secret& s){
    return os << "secret{" << s.name << ", " << s.content.size() << " bytes}";
}

content_t
decode_content(const std::string& b64){
    static const char ignore[] = " \t\r\n";
    if(b64.find_first_not_of(ignore) == std::string::npos)
        return {};
    content_t ret(b64.size()/4*3 + 3);
    size_t binlen;
    const char *b64end;
    int status = sodium_base642bin(ret.data(), ret.size(),
                                   b64.data(), b64.size(),
                                   ignore, &binlen, &b64end,
                                   sodium_base64_VARIANT_ORIGINAL);
    if(status != 0)
        throw se(EINVAL, "decode_content: sodium_base642bin failed");
    // Strict.  No trailing junk.
    if(b64end != b64.data() + b64.size())
        throw se(EINVAL, "decode_content: unexpected characters after the base64 content");
    ret.resize(binlen);
    return ret;
}

} // namespace secretfs
