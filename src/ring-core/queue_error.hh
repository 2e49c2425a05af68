#pragma once

#include <ring-core/fwd.hh>

/// Expected failures of rc::ring_queue operations.
/// Returned through rc::result<T, rc::queue_error>, never thrown.
enum class rc::queue_error : rc::u8
{
    /// create / create_from was called with a capacity <= 0
    invalid_argument,

    /// a bulk source was absent
    /// ranges and initializer lists cannot be absent, so no ring-core operation produces this
    null_source,

    /// a copy destination was absent
    /// spans cannot be absent, so no ring-core operation produces this
    null_destination,

    /// front() or pop() on a queue without elements
    empty_queue,

    /// copy_to index is negative or not below the destination size
    index_out_of_range,

    /// copy_to destination has fewer than count() slots after the index
    insufficient_capacity,

    /// a cursor was used after the queue was pushed to or popped from
    concurrent_modification,
};

namespace rc
{
/// Returns the enumerator name, e.g. "empty_queue".
/// Unknown values (only possible via casts) yield "unknown queue_error".
[[nodiscard]] char const* to_string(queue_error e);
} // namespace rc
