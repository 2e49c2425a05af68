#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/memory_resource.hh>
#include <ring-core/utility.hh>

#include <limits>
#include <new>

/// Owning handle for `capacity` uninitialized slots of T obtained from a rc::memory_resource.
///
/// Unlike a vector-style allocation, this handle does NOT track which slots hold live objects.
/// A ring's live range wraps around the end of the storage and is therefore segmented, so the
/// owning container is responsible for constructing and destroying objects in the slots.
/// The destructor only returns the bytes to the resource.
///
/// Invariants:
/// - slots == nullptr iff capacity == 0
/// - slots is aligned to at least alloc_alignment
/// - custom_resource == nullptr implies rc::default_memory_resource
template <class T>
struct rc::impl::slot_buffer
{
    /// Minimum alignment used for slot storage.
    ///
    /// We align to at least one destructive-interference unit (typically a cache line) so that
    /// distinct queues never share a cache line through their backing stores.
    static constexpr isize alloc_alignment = rc::max(isize(alignof(T)), isize(std::hardware_destructive_interference_size));

    /// First slot, nullptr for the empty handle.
    T* slots = nullptr;

    /// Number of slots (not bytes).
    isize capacity = 0;

    /// Memory resource that owns the bytes, or nullptr for the global default.
    rc::memory_resource const* custom_resource = nullptr;

public:
    /// Returns the effective resource to use for allocation operations.
    [[nodiscard]] rc::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *rc::default_memory_resource;
    }

    [[nodiscard]] bool is_valid() const { return slots != nullptr; }

    [[nodiscard]] isize size_bytes() const { return capacity * isize(sizeof(T)); }

    // factories
public:
    /// Allocates `capacity` uninitialized slots from `resource` (nullptr = default resource).
    /// capacity == 0 results in an empty handle with no allocation call.
    [[nodiscard]] static slot_buffer create_uninitialized(isize capacity, rc::memory_resource const* resource)
    {
        RC_ASSERT(capacity >= 0, "slot count must be non-negative");
        RC_ASSERT_ALWAYS(capacity <= std::numeric_limits<isize>::max() / isize(sizeof(T)), "slot buffer size in bytes overflows isize");

        slot_buffer result;
        result.custom_resource = resource;

        if (capacity == 0)
            return result;

        auto const& res = result.resource();
        rc::byte* p = nullptr;
        res.allocate_bytes(&p, capacity * isize(sizeof(T)), alloc_alignment, res.userdata);
        RC_ASSERT(p != nullptr, "memory resource returned nullptr for a non-empty request");

        result.slots = reinterpret_cast<T*>(p);
        result.capacity = capacity;
        return result;
    }

    // lifecycle
public:
    slot_buffer() = default;

    // no implicit copies, the owning container decides how slots are copied
    slot_buffer(slot_buffer const&) = delete;
    slot_buffer& operator=(slot_buffer const&) = delete;

    slot_buffer(slot_buffer&& rhs) noexcept
      : slots(rc::exchange(rhs.slots, nullptr)),
        capacity(rc::exchange(rhs.capacity, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    slot_buffer& operator=(slot_buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = rc::move(rhs);
            impl_deallocate();
            slots = rc::exchange(rhs_tmp.slots, nullptr);
            capacity = rc::exchange(rhs_tmp.capacity, 0);
            custom_resource = rhs_tmp.custom_resource;
        }
        return *this;
    }

    ~slot_buffer() { impl_deallocate(); }

private:
    void impl_deallocate()
    {
        if (slots == nullptr)
            return;

        auto const& res = resource();
        res.deallocate_bytes(reinterpret_cast<rc::byte*>(slots), size_bytes(), alloc_alignment, res.userdata);
        slots = nullptr;
        capacity = 0;
    }
};
