#include "secretfs/complaints.hpp"
#include "secretfs/diag.hpp"
#include "secretfs/log_channel.hpp"
#include "secretfs/strutils.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>

namespace secretfs{

namespace{

struct complainer_t{
    log_channel logchan{"%stderr", 0};
    std::atomic<int> level{LOG_INFO};
    std::atomic<int> seq{0};
    std::mutex mtx;     // keeps the records of one complaint together
};

complainer_t& the_complainer(){
    // Leaked on purpose.  Destructors run during static
    // destruction may still want to complain.
    static complainer_t* the = new complainer_t;
    return *the;
}

void append_lines(std::vector<std::string>& out, char levkey, int seq, int& sub, const std::string& what){
    const char *p = what.c_str();
    const char *e = p + what.size();
    while(p<e){
        const char *nl = std::find(p, e, '\n');
        out.push_back(fmt("%c[%d.%d] %.*s", levkey, seq, sub++, int(nl-p), p));
        p = nl + (nl < e);
    }
}

void deliver(int priority, const std::string& msg, const std::exception* ep){
    auto& tc = the_complainer();
    int level = priority & LOG_PRIMASK;
    if(level > tc.level.load())
        return;
    char levkey = "GACEWNID"[level];
    int seq = tc.seq++;
    std::vector<std::string> recs;
    recs.push_back(fmt("%c[%d.0] %s", levkey, seq, msg.c_str()));
    if(ep){
        int sub = 1;
        for(const auto& w : exnest_whats(*ep))
            append_lines(recs, levkey, seq, sub, w);
    }

    static auto& _complaints = diag_name("complaints");
    std::lock_guard<std::mutex> lg(tc.mtx);
    for(const auto& r : recs){
        DIAG(_complaints, r);
        tc.logchan.send(level, r);
    }
}

} // namespace <anon>

std::vector<std::string> exnest_whats(const std::exception& e){
    std::vector<std::string> ret;
    ret.push_back(e.what());
    try{
        std::rethrow_if_nested(e);
    }catch(std::exception& inner){
        auto more = exnest_whats(inner);
        ret.insert(ret.end(), more.begin(), more.end());
    }catch(...){
        ret.push_back("<nested exception not derived from std::exception>");
    }
    return ret;
}

void complain(int priority, const std::string& msg){
    deliver(priority, msg, nullptr);
}

void complain(int priority, const std::exception& e, const std::string& msg){
    deliver(priority, msg, &e);
}

void set_complaint_level(int level){
    the_complainer().level = level & LOG_PRIMASK;
}

int get_complaint_level(){
    return the_complainer().level.load();
}

void set_complaint_destination(const std::string& dest, int mode){
    the_complainer().logchan.open(dest, mode);
}

void reopen_complaint_destination(){
    the_complainer().logchan.reopen();
}

} // namespace secretfs
