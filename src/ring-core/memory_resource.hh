#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

// rc::memory_resource is the pluggable source of every backing store in ring-core.
//
// Memory is obtained from a polymorphic, POD, function-pointer based resource (static-init safe).
// Containers store the resource pointer next to their storage instead of taking an allocator
// template argument. A null resource means "use rc::default_memory_resource".
// This avoids allocator-typed container variants and allocator-propagation complexity.
//
// Usage is simple by default: do nothing and the global default resource is used.
// Custom allocators are supported by passing a non-null resource to a container factory:
//
//     auto q = rc::ring_queue<int>::create(64, &my_arena_resource).value();
//
// Contract for implementers:
// - allocate_bytes(out_ptr, bytes, alignment, userdata)
//     bytes == 0 sets *out_ptr to nullptr; bytes > 0 always yields a non-null pointer aligned to
//     at least `alignment` (a power of two). Exhaustion is fatal (assert/terminate) or throws.
// - deallocate_bytes(p, bytes, alignment, userdata)
//     p, bytes and alignment are exactly those of the matching allocate_bytes call.
//     Must not throw for valid input.

namespace rc
{
/// Default memory resource used when a container's resource pointer is nullptr.
/// This is a system allocator stored in the data segment, making the pointer valid even during
/// static initialization in other translation units (safe for use in global/static constructors).
extern rc::memory_resource const* const default_memory_resource;
} // namespace rc

/// Polymorphic memory resource interface.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct rc::memory_resource
{
    /// Allocate `bytes` with at least `alignment` alignment and store the pointer in `*out_ptr`.
    rc::function_ptr<void(rc::byte** out_ptr, isize bytes, isize alignment, void* userdata)> allocate_bytes = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    rc::function_ptr<void(rc::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};
