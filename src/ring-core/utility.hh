#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

#include <cstddef>
#include <cstring>
#include <type_traits>

// Small vocabulary helpers shared by the ring-core headers.
// They replace <utility> / <algorithm> where those would be the only reason for an include,
// and are force-inlined so that debug builds do not pay a call per move.

namespace rc
{
// ---------------------------------------------------------------------------------------------------------
// value categories

template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Stores new_val in obj and returns the previous value.
/// Used by the move operations to leave the source empty:
///   _count = rc::exchange(rhs._count, 0);
template <class T, class U = T>
[[nodiscard]] RC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = rc::forward<U>(new_val);
    return old_val;
}

// ---------------------------------------------------------------------------------------------------------
// ordering

/// Larger of a and b, b on ties.
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Smaller of a and b, a on ties.
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// ---------------------------------------------------------------------------------------------------------
// ring indices

/// (index + 1) mod size without a division.
/// Precondition: 0 <= index < size
///   wrapped_increment(2, 4) == 3
///   wrapped_increment(3, 4) == 0
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T index, T size)
{
    RC_ASSERT(size > 0, "ring index arithmetic needs a non-empty ring");
    ++index;
    return index == size ? T(0) : index;
}

/// Precondition: value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    RC_ASSERT(value > 0, "is_power_of_two is only defined for positive values");
    return (value & (value - 1)) == 0;
}

// ---------------------------------------------------------------------------------------------------------
// raw memory

/// Selects the placement new overload declared at the end of this header.
///   new (rc::placement_new, _store.slots + _back) T(rc::forward<Args>(args)...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

/// std::memcpy with a signed byte count. Zero bytes never touches the pointers (which may be null).
inline void memcpy(void* dest, void const* src, isize bytes)
{
    RC_ASSERT(bytes >= 0, "negative byte count");
    if (bytes > 0)
        std::memcpy(dest, src, size_t(bytes));
}

// ---------------------------------------------------------------------------------------------------------
// types

namespace impl
{
template <class Signature>
struct function_ptr_t; // only function signatures are supported
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Spells a function pointer type as its signature, see rc::memory_resource:
///   rc::function_ptr<void(rc::byte* p, isize bytes, isize alignment, void* userdata)>
template <class Signature>
using function_ptr = typename impl::function_ptr_t<Signature>::type;

/// End marker of ring_queue::begin(). The iterator itself knows how many elements remain.
struct sentinel
{
};
} // namespace rc

[[nodiscard]] RC_FORCE_INLINE void* operator new(std::size_t, rc::placement_new_t, void* p) noexcept
{
    return p;
}

// only reached when a constructor invoked through the placement new above throws
RC_FORCE_INLINE void operator delete(void*, rc::placement_new_t, void*) noexcept {}
