#pragma once

#include <sci-core/assert.hh>
#include <sci-core/fwd.hh>

#include <new>

// Small replacements for <utility> and <algorithm> pieces, so the view headers stay light:
//
//   move(v), forward<T>(v), exchange(obj, v)
//   min(a, b), max(a, b)
//   int_div_round_up(nom, denom)        ceil(nom / denom), used for strided slice lengths
//   swap(a, b)                          finds ADL swap overloads (e.g. cow_array's)
//   new (sc::placement_new, ptr) T(..)  placement new without the global placement form

namespace sc
{
template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Assigns new_val to obj and returns the previous value.
/// Typical use is taking over a pointer: auto block = sc::exchange(_block, nullptr);
template <class T, class U = T>
[[nodiscard]] SC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

/// On equality, max returns b and min returns a.
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b;
}
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a;
}

/// ceil(nom / denom) without the overflow of (nom + denom - 1) / denom.
/// Precondition: nom >= 0, denom > 0
/// e.g. a strided slice over 5 elements with step 2 has int_div_round_up(5, 2) == 3 elements
template <class T>
[[nodiscard]] constexpr T int_div_round_up(T nom, T denom)
{
    SC_ASSERT(nom >= 0 && denom > 0, "int_div_round_up: nom must be non-negative and denom positive");
    return nom / denom + (nom % denom != 0 ? 1 : 0);
}

namespace impl
{
struct swap_fn
{
    template <class T>
    constexpr void operator()(T& a, T& b) const;
};
} // namespace impl

/// sc::swap(a, b) uses a swap(a, b) found by ADL if there is one, otherwise three moves.
/// A function object, so ADL never picks sc::swap itself.
[[maybe_unused]] constexpr impl::swap_fn swap;

struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};

} // namespace sc

[[nodiscard]] SC_FORCE_INLINE void* operator new(std::size_t, sc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
// only called if a constructor throws inside placement new
SC_FORCE_INLINE void operator delete(void*, sc::placement_new_t, void*) noexcept {}

// outside of namespace sc so unqualified swap cannot find sc::swap
namespace _no_sc_namespace // NOLINT
{
template <class T>
constexpr void do_swap_impl(T& a, T& b)
{
    if constexpr (requires { swap(a, b); })
    {
        swap(a, b);
    }
    else
    {
        T tmp = static_cast<T&&>(a);
        a = static_cast<T&&>(b);
        b = static_cast<T&&>(tmp);
    }
}
} // namespace _no_sc_namespace

template <class T>
constexpr void sc::impl::swap_fn::operator()(T& a, T& b) const
{
    _no_sc_namespace::do_swap_impl(a, b);
}
