#pragma once

#include <cstdint>

#include <clean-core/span.hh>
#include <clean-core/xxHash.hh>

#include <retained-interface/detail/traits.hh>

namespace ri::detail
{
/// folds one call-site key component into the running hash
template <class T>
void combine_hash(uint64_t& hash, T const& v)
{
    if constexpr (can_be_string_view<T const>)
    {
        auto sv = cc::string_view(v);
        hash = cc::hash_xxh3(cc::span(sv).as_bytes(), hash);
    }
    else
    {
        static_assert(std::is_trivially_copyable_v<T>, "call-site keys must be string-like or trivially copyable");
        hash = cc::hash_xxh3(cc::span<T const>(v).as_bytes(), hash);
    }
}

template <class... Args>
uint64_t make_hash(uint64_t seed, Args const&... args)
{
    static_assert(sizeof...(Args) > 0, "must provide at least one key");
    auto h = seed;
    (combine_hash(h, args), ...);
    return h;
}
}
