#include "secretfs/secret.hpp"
#include "secretfs/complaints.hpp"
#include "secretfs/ut.hpp"
#include "test_backends.hpp"
#include <sstream>
#include <system_error>
#include <sys/stat.h>

using namespace secretfs;

static std::string as_string(const content_t& c){
    return std::string(c.begin(), c.end());
}

static bool decode_throws(const std::string& b64){
    try{
        decode_content(b64);
    }catch(std::system_error& e){
        return e.code().value() == EINVAL;
    }
    return false;
}

int main(int, char **){
    set_complaint_level(LOG_ERR);

    // mode_value
    secret s;
    EQUAL(s.mode_value(), mode_t(0440 | S_IFREG));
    s.mode = "0400";
    EQUAL(s.mode_value(), mode_t(0400 | S_IFREG));
    s.mode = "644";
    EQUAL(s.mode_value(), mode_t(0644 | S_IFREG));
    s.mode = "rw-r--r--";
    EQUAL(s.mode_value(), mode_t(0440 | S_IFREG));
    s.mode = "0999";
    EQUAL(s.mode_value(), mode_t(0440 | S_IFREG));
    s.mode = "0400x";
    EQUAL(s.mode_value(), mode_t(0440 | S_IFREG));
    s.mode = "177777";
    EQUAL(s.mode_value(), mode_t(0440 | S_IFREG));

    // decode_content
    EQSTR(as_string(decode_content("YXNkZGFz")), "asddas");
    EQSTR(as_string(decode_content("a2V5d2hpeg==")), "keywhiz");
    EQSTR(as_string(decode_content("a2V5\nd2hp\r\neg==\n")), "keywhiz");
    EQUAL(decode_content("").size(), 0u);
    EQUAL(decode_content(" \n").size(), 0u);
    CHECK(decode_throws("not base64!"));
    CHECK(decode_throws("a2V5d2hpeg"));    // missing padding
    CHECK(decode_throws("a2V5d2hpeg==junk"));
    // Binary content survives.
    auto bin = decode_content("AAH/");
    EQUAL(bin.size(), 3u);
    CHECK(bin.size() == 3 && bin[0] == 0 && bin[1] == 1 && bin[2] == 0xff);

    // Equality is field-wise.
    auto a = fixture1();
    auto b = fixture1();
    CHECK(a == b);
    b.owner = "root";
    CHECK(a != b);
    b = fixture1();
    b.content = decode_content("YXNkZGFy");
    CHECK(a != b);
    b = fixture1();
    b.is_versioned = false;
    CHECK(a != b);
    CHECK(fixture1() != fixture2());

    // Printing never shows the bytes.
    std::ostringstream oss;
    oss << fixture1();
    EQSTR(oss.str(), "secret{General_Password..0be68f903f8b7d86, 6 bytes}");
    CHECK(oss.str().find("asddas") == std::string::npos);

    return utstatus();
}
