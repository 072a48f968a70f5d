#pragma once

#include <sci-core/fwd.hh>
#include <sci-core/utility.hh>

#include <cstring>
#include <type_traits>

// Helpers for starting and ending object lifetimes in raw element storage.
// All creating helpers advance a caller-owned "dest_end" pointer one element at a time, so after an
// exception [obj_start, dest_end) is exactly the range that has to be destroyed again.

namespace sc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Value-constructs `count` objects at dest_end using placement new.
/// T() ensures zero-initialization for arithmetic types, which views rely on for "additive identity".
template <class T>
constexpr void default_create_objects_to(T*& dest_end, isize count)
{
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (sc::placement_new, dest_end) T();
        ++dest_end;
    }
}

/// Copy-constructs `count` objects from a single value at dest_end.
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (sc::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs objects from [src_start, src_end) at dest_end.
/// Trivially copyable types are copied with a single memcpy.
/// This is the workhorse of the copy-on-write fork.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (sc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Copy-constructs `count` objects from src_start[0], src_start[stride], ... at dest_end.
template <class T>
constexpr void copy_create_strided_objects_to(T*& dest_end, T const* src_start, isize count, isize stride)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (sc::placement_new, dest_end) T(src_start[i * stride]);
        ++dest_end;
    }
}
} // namespace sc::impl
