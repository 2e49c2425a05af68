#pragma once

#include <cstddef>
#include <cstdint>


namespace rc
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout
// and plain "int" where it does not (loop counters, small counts).

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, capacities and ring indices are signed:
// * "capacity - front" and similar differences never silently wrap around
// * negative values are meaningful as rejected inputs (e.g. a negative copy_to index)
// * we only target 64-bit platforms, so the range is plenty
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;

namespace impl
{
template <class T>
struct slot_buffer;
}

//
// Views
//

template <class T>
struct span;

//
// Error handling
//

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

enum class queue_error : u8;

//
// Container
//

template <class T>
struct ring_queue;

} // namespace rc
