#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <type_traits>

// Object lifetime helpers for raw slot memory.
// All functions operate on one contiguous segment; ring containers call them once per segment
// of their (possibly wrapped) live range.
// Construction into slots is done element by element by the container itself, because it has to
// keep its live range in sync with every successfully constructed object.

namespace rc::impl
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

/// Copy-assigns objects from [src_start, src_end) onto already alive objects starting at dest_end.
/// dest_end is incremented for each successfully assigned object.
/// If copy assignment throws, dest_end points to the element that threw (partially modified state).
/// Trivially copyable types are optimized to use memcpy at compile time.
///
/// Usage pattern (copy-out into a caller-provided buffer):
///   auto out = destination.data() + index;
///   copy_assign_objects_to(out, first_segment_start, first_segment_end);
///   copy_assign_objects_to(out, second_segment_start, second_segment_end);
template <class T>
constexpr void copy_assign_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_assignable_v<T>, "T must be copy assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            rc::memcpy(dest_end, src_start, size * isize(sizeof(T)));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            *dest_end = *src_start;
            ++dest_end;
            ++src_start;
        }
    }
}
} // namespace rc::impl
