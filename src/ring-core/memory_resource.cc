#include "memory_resource.hh"

#include <ring-core/assert.hh>
#include <ring-core/macros.hh>
#include <ring-core/utility.hh>

#include <cstdlib>

#ifdef RC_OS_WINDOWS
#include <malloc.h>
#endif

namespace
{
// The system allocator is stateless and ignores userdata.

void system_allocate_bytes(rc::byte** out_ptr, rc::isize bytes, rc::isize alignment, void* userdata)
{
    RC_UNUSED(userdata);

    RC_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    RC_ASSERT(bytes >= 0, "bytes must be non-negative");
    RC_ASSERT(alignment > 0 && rc::is_power_of_two(alignment), "alignment must be a power of 2");

    // Contract: bytes == 0 always yields nullptr
    if (bytes == 0)
    {
        *out_ptr = nullptr;
        return;
    }

    rc::byte* p = nullptr;

#ifdef RC_OS_WINDOWS
    p = static_cast<rc::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign does not require bytes % alignment == 0 (unlike std::aligned_alloc),
    // but it requires alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    rc::isize const effective_alignment = alignment < rc::isize(sizeof(void*)) ? rc::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(bytes));
    p = result == 0 ? static_cast<rc::byte*>(raw_ptr) : nullptr;
#endif

    RC_ASSERT_ALWAYS(p != nullptr, "system allocation failed");
    *out_ptr = p;
}

void system_deallocate_bytes(rc::byte* p, rc::isize bytes, rc::isize alignment, void* userdata)
{
    RC_UNUSED(bytes);
    RC_UNUSED(alignment);
    RC_UNUSED(userdata);

    // Must use the free function matching the platform allocator above
#ifdef RC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

/// Stored in the data segment (not on heap) so it remains valid during static initialization.
constinit rc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit rc::memory_resource const* const rc::default_memory_resource = &system_memory_resource;
