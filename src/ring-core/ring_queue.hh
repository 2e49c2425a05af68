#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/impl/object_lifetime_util.hh>
#include <ring-core/impl/slot_buffer.hh>
#include <ring-core/memory_resource.hh>
#include <ring-core/queue_error.hh>
#include <ring-core/result.hh>
#include <ring-core/span.hh>
#include <ring-core/utility.hh>

#include <initializer_list>
#include <limits>
#include <ranges>
#include <type_traits>

namespace rc::impl
{
/// Slot count after growing a full ring of `capacity` slots, max(1, 2 * capacity).
[[nodiscard]] constexpr isize grown_ring_capacity(isize capacity)
{
    RC_ASSERT_ALWAYS(capacity <= std::numeric_limits<isize>::max() / 2, "ring_queue capacity cannot be doubled without overflow");
    return rc::max(isize(1), 2 * capacity);
}
} // namespace rc::impl

/// Growable FIFO queue over a circular buffer.
///
/// Elements live in a fixed-size store of `capacity()` slots. The live range starts at `_front` and
/// wraps around the end of the store: `[_front, _front + _count) mod capacity`. Slots outside that
/// range hold no object. When a push finds the store full, it is replaced by one of twice the size
/// (at least 1 slot) and the live range is compacted to start at slot 0. The store never shrinks.
///
/// Usage:
///
///     auto q = rc::ring_queue<int>::create(4).value();
///     q.push(1);
///     q.push(2);
///     auto const first = q.pop().value(); // == 1
///
///     for (auto const& v : q) // fail-fast, see "iteration" below
///         use(v);
///
/// Error handling:
/// - expected failures (empty queue, too small copy destination, stale cursor, bad capacity)
///   are returned as rc::result<..., rc::queue_error>; failed operations change nothing
/// - programmer errors (cursor access without element, mutated queue under a range-for) assert
/// - exceptions only come from T; the queue stays structurally valid when they propagate
///
/// Iteration:
/// Every push and pop increments `generation()`. Cursors (make_cursor) and range-for iterators
/// capture it on creation and compare on every step, so structural modification during a traversal
/// is detected on the next access instead of yielding garbage.
/// Cursors report it as queue_error::concurrent_modification, iterators via RC_ASSERT_ALWAYS.
/// Cursors and iterators refer to the queue by address: they must not outlive it and do not follow moves.
///
/// Value semantics:
/// Copies are deep (same capacity and resource, live range compacted to slot 0, fresh generation).
/// Moves are O(1) and leave the source empty with capacity 0; such a queue can be pushed to again.
///
/// Not thread-safe.
template <class T>
struct rc::ring_queue
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "ring_queue elements must be non-const object types");

    /// Capacity used when none is given.
    static constexpr isize default_capacity = 50;

    template <bool IsConst>
    struct basic_cursor;
    template <bool IsConst>
    struct basic_iterator;

    using cursor = basic_cursor<false>;
    using const_cursor = basic_cursor<true>;
    using iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true>;

    // factories
public:
    /// Creates an empty queue with `capacity` slots obtained from `resource` (nullptr = default resource).
    /// Fails with queue_error::invalid_argument if capacity <= 0.
    [[nodiscard]] static result<ring_queue, queue_error> create(isize capacity = default_capacity,
                                                                rc::memory_resource const* resource = nullptr)
    {
        if (capacity <= 0)
            return rc::error(queue_error::invalid_argument);

        return ring_queue(capacity, resource);
    }

    /// Creates a queue holding the elements of `source` in iteration order.
    /// The source is traversed once; the queue grows as needed, so `capacity` is only the initial size.
    /// Fails with queue_error::invalid_argument if capacity <= 0.
    /// Usage:
    ///   auto q = rc::ring_queue<int>::create_from(std::vector<int>{1, 2, 3}, 1).value();
    template <class Range>
        requires std::ranges::input_range<Range> && std::is_constructible_v<T, std::ranges::range_reference_t<Range>>
    [[nodiscard]] static result<ring_queue, queue_error> create_from(Range&& source,
                                                                     isize capacity = default_capacity,
                                                                     rc::memory_resource const* resource = nullptr)
    {
        return impl_create_from(source, capacity, resource);
    }

    /// Creates a queue holding copies of the listed elements.
    /// Usage:
    ///   auto q = rc::ring_queue<int>::create_from({1, 2, 3, 2}, 1).value();
    [[nodiscard]] static result<ring_queue, queue_error> create_from(std::initializer_list<T> source,
                                                                     isize capacity = default_capacity,
                                                                     rc::memory_resource const* resource = nullptr)
    {
        return impl_create_from(source, capacity, resource);
    }

    // lifecycle
public:
    /// Deep copy: same capacity and resource, elements compacted to start at slot 0.
    /// The copy starts with generation 0.
    ring_queue(ring_queue const& rhs)
        requires std::is_copy_constructible_v<T>
      : ring_queue(rhs.capacity(), rhs._store.custom_resource)
    {
        // delegated constructor has finished, so a throwing copy is cleaned up by our destructor
        auto const k = rhs.impl_first_segment_size();
        for (isize i = 0; i < k; ++i)
            impl_emplace_back_stable(rhs._store.slots[rhs._front + i]);
        for (isize i = 0; i < rhs._count - k; ++i)
            impl_emplace_back_stable(rhs._store.slots[i]);
    }

    /// O(1), leaves rhs empty with capacity 0.
    /// Counts as a modification of rhs, so cursors and iterators on rhs detect it.
    ring_queue(ring_queue&& rhs) noexcept
      : _store(rc::move(rhs._store)),
        _front(rc::exchange(rhs._front, 0)),
        _back(rc::exchange(rhs._back, 0)),
        _count(rc::exchange(rhs._count, 0)),
        _generation(rhs._generation)
    {
        ++rhs._generation;
    }

    ring_queue& operator=(ring_queue const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
            *this = ring_queue(rhs);
        return *this;
    }

    /// Destroys the current elements and takes over rhs' store.
    /// Counts as a modification of both queues.
    ring_queue& operator=(ring_queue&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_destroy_live();
            _store = rc::move(rhs._store);
            _front = rc::exchange(rhs._front, 0);
            _back = rc::exchange(rhs._back, 0);
            _count = rc::exchange(rhs._count, 0);
            ++_generation;
            ++rhs._generation;
        }
        return *this;
    }

    ~ring_queue() { impl_destroy_live(); }

    // queries
public:
    /// Number of live elements.
    [[nodiscard]] isize count() const { return _count; }

    [[nodiscard]] bool is_empty() const { return _count == 0; }

    /// Number of slots in the store.
    /// At least 1 for every queue obtained from create / create_from or a copy.
    /// The one exception to that is a moved-from queue: it has 0 slots, and its next push grows it to 1.
    [[nodiscard]] isize capacity() const { return _store.capacity; }

    /// Modification counter, incremented by every push and pop.
    /// Only meant to be compared for equality.
    [[nodiscard]] u64 generation() const { return _generation; }

    /// Resource backing the store (nullptr = default resource).
    [[nodiscard]] rc::memory_resource const* resource() const { return _store.custom_resource; }

    // element access
public:
    /// Returns the oldest element without removing it.
    /// Fails with queue_error::empty_queue if the queue has no elements.
    [[nodiscard]] result<T&, queue_error> front()
    {
        if (_count == 0)
            return rc::error(queue_error::empty_queue);
        return _store.slots[_front];
    }
    [[nodiscard]] result<T const&, queue_error> front() const
    {
        if (_count == 0)
            return rc::error(queue_error::empty_queue);
        return _store.slots[_front];
    }

    // push / pop
public:
    /// Constructs a new element behind the newest one and returns a reference to it.
    /// Grows the store to max(1, 2 * capacity()) if it is full.
    /// The new element is constructed before existing elements are relocated,
    /// so arguments referring into this queue (e.g. q.push(q.front().value())) are safe.
    /// Amortized O(1). If T(args...) throws, only the generation has changed.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        static_assert(std::is_constructible_v<T, Args&&...>, "emplace: T is not constructible from the provided argument types");

        ++_generation;

        if (_count == capacity()) [[unlikely]]
            return impl_grow_and_emplace(rc::forward<Args>(args)...);

        return impl_emplace_back_stable(rc::forward<Args>(args)...);
    }

    /// Appends a copy of value, see emplace.
    T& push(T const& value) { return emplace(value); }

    /// Appends value by move, see emplace.
    T& push(T&& value) { return emplace(rc::move(value)); }

    /// Removes the oldest element and returns it by move.
    /// Fails with queue_error::empty_queue (and changes nothing) if the queue has no elements.
    /// The vacated slot holds no object afterwards.
    [[nodiscard("pop() returns the removed element or queue_error::empty_queue")]] result<T, queue_error> pop()
    {
        if (_count == 0)
            return rc::error(queue_error::empty_queue);

        auto& slot = _store.slots[_front];
        result<T, queue_error> popped = rc::move(slot);
        slot.~T();

        _front = rc::wrapped_increment(_front, capacity());
        --_count;
        ++_generation;
        return popped;
    }

    // bulk copy
public:
    /// Copy-assigns all elements, oldest first, to destination[index], destination[index + 1], ...
    /// Destination elements outside [index, index + count()) are not touched.
    /// Fails with
    /// - queue_error::index_out_of_range if index < 0 or index >= destination.size()
    ///   (so an empty destination always fails, even for an empty queue)
    /// - queue_error::insufficient_capacity if destination.size() - index < count()
    /// Does not change the generation.
    [[nodiscard]] result<void, queue_error> copy_to(rc::span<T> destination, isize index) const
    {
        if (index < 0 || index >= destination.size())
            return rc::error(queue_error::index_out_of_range);
        if (destination.size() - index < _count)
            return rc::error(queue_error::insufficient_capacity);

        // at most two contiguous segments: [front, front + k) and [0, count - k)
        auto out = destination.data() + index;
        auto const k = impl_first_segment_size();
        impl::copy_assign_objects_to(out, _store.slots + _front, _store.slots + _front + k);
        impl::copy_assign_objects_to(out, _store.slots, _store.slots + (_count - k));
        return {};
    }

    // iteration
public:
    /// Returns a fail-fast cursor positioned before the oldest element.
    /// Usage:
    ///   auto c = q.make_cursor();
    ///   while (c.move_next().value())  // .value() asserts if the queue was modified
    ///       use(c.current());
    [[nodiscard]] cursor make_cursor() { return cursor(this); }
    [[nodiscard]] const_cursor make_cursor() const { return const_cursor(this); }

    /// Range-for support, oldest element first.
    /// Modifying the queue while iterating triggers RC_ASSERT_ALWAYS on the next iterator access.
    [[nodiscard]] iterator begin() { return iterator(this); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(this); }
    [[nodiscard]] rc::sentinel end() const { return {}; }

    // helper
private:
    // allocates an empty store, used by the factories and for growth
    ring_queue(isize capacity, rc::memory_resource const* resource)
      : _store(impl::slot_buffer<T>::create_uninitialized(capacity, resource))
    {
    }

    template <class Range>
    static result<ring_queue, queue_error> impl_create_from(Range&& source, isize capacity, rc::memory_resource const* resource)
    {
        auto res = create(capacity, resource);
        if (res.has_error())
            return res;

        auto& q = res.value();
        for (auto&& v : source)
            q.emplace(rc::forward<decltype(v)>(v));

        return res;
    }

    // number of live elements in [_front, capacity), the first of the (at most) two live segments
    [[nodiscard]] isize impl_first_segment_size() const { return rc::min(_count, capacity() - _front); }

    // constructs at _back without growth or generation change
    // _count is incremented _after_ construction so a throwing T(...) leaves the state valid
    template <class... Args>
    T& impl_emplace_back_stable(Args&&... args)
    {
        RC_ASSERT(_count < capacity(), "no free slot for impl_emplace_back_stable");
        auto const p = new (rc::placement_new, _store.slots + _back) T(rc::forward<Args>(args)...);
        _back = rc::wrapped_increment(_back, capacity());
        ++_count;
        return *p;
    }

    // replaces the full store by one of max(1, 2 * capacity) slots and then appends T(args...)
    //
    // The new store is owned by a temporary queue whose live range is always exactly the set of
    // constructed objects, so a throwing T(...) or move constructor leaks nothing:
    // 1. construct the new element at slot _count of the new store (old store still intact)
    // 2. move the old elements in reverse order into the slots in front of it, growing the
    //    temporary's live range towards slot 0
    // 3. destroy the moved-from old elements and adopt the new store
    // Afterwards front == 0, back == (count + 1) mod new_capacity; generation is not touched here.
    template <class... Args>
    RC_COLD_FUNC T& impl_grow_and_emplace(Args&&... args)
    {
        auto const new_capacity = impl::grown_ring_capacity(capacity());
        RC_ASSERT(new_capacity > _count, "growth must leave room for the new element");

        auto grown = ring_queue(new_capacity, _store.custom_resource);
        grown._front = _count;
        grown._back = _count;
        auto& added = grown.impl_emplace_back_stable(rc::forward<Args>(args)...);

        // second segment first since we fill the new store back to front
        auto const k = impl_first_segment_size();
        grown.impl_relocate_to_front_reverse(_store.slots, _count - k);
        grown.impl_relocate_to_front_reverse(_store.slots + _front, k);
        RC_ASSERT(grown._front == 0, "relocation must compact the live range to slot 0");

        impl_destroy_live();
        _store = rc::move(grown._store);
        _front = 0;
        _back = rc::exchange(grown._back, 0);
        _count = rc::exchange(grown._count, 0);
        grown._front = 0;

        return added;
    }

    // move-constructs src[n - 1], ..., src[0] into the slots directly in front of _front
    void impl_relocate_to_front_reverse(T* src, isize n)
    {
        for (auto i = n; i > 0; --i)
        {
            RC_ASSERT(_front > 0, "no free slot in front of the live range");
            new (rc::placement_new, _store.slots + _front - 1) T(rc::move(src[i - 1]));
            --_front; // _after_ so a throwing move leaves the live range valid
            ++_count;
        }
    }

    // destroys all live elements (newest first) and resets the indices, keeps the store
    void impl_destroy_live()
    {
        auto const k = impl_first_segment_size();
        impl::destroy_objects_in_reverse(_store.slots, _store.slots + (_count - k));
        impl::destroy_objects_in_reverse(_store.slots + _front, _store.slots + _front + k);
        _front = 0;
        _back = 0;
        _count = 0;
    }

    // members
private:
    impl::slot_buffer<T> _store;

    /// slot of the oldest element, meaningful only if _count > 0
    isize _front = 0;

    /// slot the next pushed element goes to
    isize _back = 0;

    /// number of live elements, the only source of truth for empty/full (_front == _back is both)
    isize _count = 0;

    u64 _generation = 0;
};

/// Explicit, fail-fast traversal of a ring_queue.
///
/// The cursor starts before the oldest element. move_next() advances and reports whether an
/// element is available; current() accesses it. Termination is decided by the number of produced
/// elements, not by slot indices (a full queue has front == back).
/// Any push or pop on the queue after the cursor was created (or last reset) makes the next
/// move_next() or reset() fail with queue_error::concurrent_modification.
/// Several cursors over the same queue are independent.
template <class T>
template <bool IsConst>
struct rc::ring_queue<T>::basic_cursor
{
    using queue_ptr = std::conditional_t<IsConst, ring_queue const*, ring_queue*>;
    using reference = std::conditional_t<IsConst, T const&, T&>;

    /// Advances to the next element.
    /// Returns true if positioned on an element, false once all elements were produced.
    /// An exhausted cursor keeps returning false until reset().
    [[nodiscard]] result<bool, queue_error> move_next()
    {
        if (_generation != _queue->_generation)
            return rc::error(queue_error::concurrent_modification);

        if (_produced == _queue->_count)
        {
            _positioned = false;
            return false;
        }

        _slot = _produced == 0 ? _queue->_front : rc::wrapped_increment(_slot, _queue->capacity());
        ++_produced;
        _positioned = true;
        return true;
    }

    /// Element the cursor is positioned on.
    /// Precondition: the last move_next() returned true and the queue was not modified since.
    [[nodiscard]] reference current() const
    {
        RC_ASSERT(_positioned, "cursor is not positioned on an element");
        RC_ASSERT(_generation == _queue->_generation, "queue was modified after the cursor was positioned");
        return _queue->_store.slots[_slot];
    }

    /// Restarts the traversal before the oldest element.
    /// Fails with queue_error::concurrent_modification if the queue was modified, the cursor stays unusable then.
    [[nodiscard]] result<void, queue_error> reset()
    {
        if (_generation != _queue->_generation)
            return rc::error(queue_error::concurrent_modification);

        _produced = 0;
        _slot = 0;
        _positioned = false;
        return {};
    }

private:
    explicit basic_cursor(queue_ptr queue) : _queue(queue), _generation(queue->_generation) {}

    queue_ptr _queue;
    u64 _generation;
    isize _slot = 0;
    isize _produced = 0;
    bool _positioned = false;

    friend ring_queue;
};

/// Range-for iterator, compared against rc::sentinel.
/// Checks the queue generation with RC_ASSERT_ALWAYS on dereference and increment.
template <class T>
template <bool IsConst>
struct rc::ring_queue<T>::basic_iterator
{
    using queue_ptr = std::conditional_t<IsConst, ring_queue const*, ring_queue*>;
    using reference = std::conditional_t<IsConst, T const&, T&>;

    [[nodiscard]] reference operator*() const
    {
        RC_ASSERT_ALWAYS(_generation == _queue->_generation, "ring_queue was modified during iteration");
        RC_ASSERT(_remaining > 0, "dereferencing an exhausted iterator");
        return _queue->_store.slots[_slot];
    }

    basic_iterator& operator++()
    {
        RC_ASSERT_ALWAYS(_generation == _queue->_generation, "ring_queue was modified during iteration");
        RC_ASSERT(_remaining > 0, "incrementing an exhausted iterator");
        _slot = rc::wrapped_increment(_slot, _queue->capacity());
        --_remaining;
        return *this;
    }

    [[nodiscard]] bool operator==(rc::sentinel) const { return _remaining == 0; }

private:
    explicit basic_iterator(queue_ptr queue)
      : _queue(queue), _generation(queue->_generation), _slot(queue->_front), _remaining(queue->_count)
    {
    }

    queue_ptr _queue;
    u64 _generation;
    isize _slot;
    isize _remaining;

    friend ring_queue;
};
