#pragma once
#include <cstddef>
#include <new>
#include <sodium.h>

// sodium_allocator - a std::allocator look-alike that gets its memory
// from libsodium's sodium_allocarray and returns it with sodium_free.
// Memory obtained this way is mlock'ed, surrounded by guard pages and
// zeroed when it's freed, which is what we want for secret content.
//
// Beware:  every allocation burns three or four pages, and it's a lot
// slower than malloc.  Use it for secret bytes, not for bookkeeping.
//
// sodium_init must be called before the first sodium_allocarray.  The
// allocator takes care of that itself, so callers needn't.

namespace secretfs{

template <class T>
class sodium_allocator
{
public:
    using value_type = T;

    sodium_allocator() noexcept {}
    template <class U> sodium_allocator(sodium_allocator<U> const&) noexcept {}

    value_type* allocate(std::size_t n)
    {
        static const bool initialized = (sodium_init() >= 0);
        if(!initialized)
            throw std::bad_alloc();
        auto p = static_cast<value_type*>(sodium_allocarray(n, sizeof(value_type)));
        if(p == nullptr)
            throw std::bad_alloc();
        return p;
    }

    void deallocate(value_type* p, std::size_t) noexcept
    {
        sodium_free(p);
    }
};

template <class T, class U>
bool operator==(sodium_allocator<T> const&, sodium_allocator<U> const&) noexcept
{
    return true;
}

template <class T, class U>
bool operator!=(sodium_allocator<T> const& x, sodium_allocator<U> const& y) noexcept
{
    return !(x == y);
}

} // namespace secretfs
