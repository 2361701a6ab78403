#pragma once

// secret_backends for the unit tests, and a couple of fixtures.

#include "secretfs/secret_backend.hpp"
#include "secretfs/secret.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// failing_backend - always says no.
struct failing_backend : public secretfs::secret_backend{
    std::atomic<int> secret_calls{0};
    std::atomic<int> list_calls{0};
    bool fetch_secret(const std::string&, secretfs::secret*) override{
        secret_calls++;
        return false;
    }
    bool fetch_secret_list(std::vector<secretfs::secret>*) override{
        list_calls++;
        return false;
    }
};

// channel_backend - hands out answers queued by the test, one per
// call.  A call that finds nothing queued blocks until something is
// queued, or until release() is called, after which every pending and
// future call without a queued answer returns false.
//
// Tests that leave calls blocked should release() before they exit.
struct channel_backend : public secretfs::secret_backend{
    std::atomic<int> secret_calls{0};
    std::atomic<int> list_calls{0};

    void push_secret(secretfs::secret s){
        std::lock_guard<std::mutex> lg(mtx);
        secrets.push_back(std::move(s));
        cv.notify_all();
    }
    void push_list(std::vector<secretfs::secret> l){
        std::lock_guard<std::mutex> lg(mtx);
        lists.push_back(std::move(l));
        cv.notify_all();
    }
    size_t pending_secrets(){
        std::lock_guard<std::mutex> lg(mtx);
        return secrets.size();
    }
    size_t pending_lists(){
        std::lock_guard<std::mutex> lg(mtx);
        return lists.size();
    }
    void release(){
        std::lock_guard<std::mutex> lg(mtx);
        released = true;
        cv.notify_all();
    }

    bool fetch_secret(const std::string&, secretfs::secret* out) override{
        secret_calls++;
        std::unique_lock<std::mutex> lk(mtx);
        cv.wait(lk, [this]{ return released || !secrets.empty(); });
        if(secrets.empty())
            return false;
        *out = std::move(secrets.front());
        secrets.pop_front();
        return true;
    }
    bool fetch_secret_list(std::vector<secretfs::secret>* out) override{
        list_calls++;
        std::unique_lock<std::mutex> lk(mtx);
        cv.wait(lk, [this]{ return released || !lists.empty(); });
        if(lists.empty())
            return false;
        *out = std::move(lists.front());
        lists.pop_front();
        return true;
    }
private:
    std::mutex mtx;
    std::condition_variable cv;
    std::deque<secretfs::secret> secrets;
    std::deque<std::vector<secretfs::secret>> lists;
    bool released = false;
};

// throwing_backend - throws a nested exception, the way a real client
// might when its transport fails.
struct throwing_backend : public secretfs::secret_backend{
    bool fetch_secret(const std::string& name, secretfs::secret*) override{
        try{
            throw std::runtime_error("connection reset by peer");
        }catch(std::exception&){
            std::throw_with_nested(std::runtime_error("throwing_backend::fetch_secret(" + name + ")"));
        }
    }
    bool fetch_secret_list(std::vector<secretfs::secret>*) override{
        throw std::runtime_error("throwing_backend::fetch_secret_list");
    }
};

// fixture1 and fixture2 have different names, owners and content.
// Tests that want a conflict assign fixture1's name to fixture2.
inline secretfs::secret fixture1(){
    secretfs::secret s;
    s.name = "General_Password..0be68f903f8b7d86";
    s.content = secretfs::decode_content("YXNkZGFz");   // "asddas"
    s.length = 6;
    s.created_at = std::chrono::system_clock::time_point(std::chrono::seconds(1422644512));
    s.is_versioned = true;
    s.mode = "0400";
    s.owner = "nobody";
    s.group = "nobody";
    return s;
}

inline secretfs::secret fixture2(){
    secretfs::secret s;
    s.name = "NormalOwner_Password";
    s.content = secretfs::decode_content("a2V5d2hpeg==");   // "keywhiz"
    s.length = 7;
    s.created_at = std::chrono::system_clock::time_point(std::chrono::seconds(1422644600));
    s.mode = "0440";
    s.owner = "root";
    s.group = "root";
    return s;
}

inline secretfs::secret named(const std::string& name, const std::string& b64 = "dmFsdWU="){
    secretfs::secret s;
    s.name = name;
    s.content = secretfs::decode_content(b64);
    s.length = s.content.size();
    return s;
}
