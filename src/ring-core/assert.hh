#pragma once

#include <ring-core/macros.hh>
#include <ring-core/source_location.hh>

// Assertions guard programmer errors inside ring-core: broken internal invariants and violated
// preconditions such as reading a cursor that is not positioned on an element.
// Recoverable conditions (popping an empty queue, a too small copy_to destination) are never
// asserted, they are returned as rc::result<T, rc::queue_error>.
//
// RC_ASSERT(cond, msg)
//   checked iff RC_ASSERT_ENABLED (debug, release-with-debug-info, or RC_ENABLE_ASSERT_IN_RELEASE)
//   in other builds cond and msg are type-checked but not evaluated
//
// RC_ASSERT_ALWAYS(cond, msg)
//   checked in every build, for failures that would otherwise read freed or foreign slots,
//   e.g. advancing a range-for iterator over a queue that was pushed to in the loop body
//
// msg must be a string literal or another char const* that outlives the call.
// A failed assertion is reported to the innermost handler of <ring-core/assert-handler.hh>
// (stderr when none is installed). If the handler returns, the process aborts.
//
// Usage:
//   RC_ASSERT(_count < capacity(), "no free slot for impl_emplace_back_stable");

#define RC_ASSERT_ALWAYS(cond, msg)                                                  \
    do                                                                               \
    {                                                                                \
        if (!(cond)) [[unlikely]]                                                    \
            ::rc::impl::assertion_failed(#cond, msg, ::rc::source_location::current()); \
    } while (false)

#if RC_ASSERT_ENABLED
#define RC_ASSERT(cond, msg) RC_ASSERT_ALWAYS(cond, msg)
#else
#define RC_ASSERT(cond, msg) \
    do                       \
    {                        \
        RC_UNUSED(cond);     \
        RC_UNUSED(msg);      \
    } while (false)
#endif

namespace rc::impl
{
// reports the failure and terminates unless the active handler throws
[[noreturn]] RC_COLD_FUNC void assertion_failed(char const* expression, char const* message, rc::source_location location);
} // namespace rc::impl
