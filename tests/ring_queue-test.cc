#include <ring-core/queue_error.hh>
#include <ring-core/ring_queue.hh>
#include <ring-core/span.hh>
#include <ring-core/utility.hh>

#include "assertion-capture.hh"
#include "test-types.hh"

#include <nexus/test.hh>

#include <initializer_list>
#include <limits>
#include <ranges>
#include <string>
#include <type_traits>
#include <vector>

using rc_test::CountingResource;
using rc_test::MoveOnly;
using rc_test::ThrowsOnCopy;
using rc_test::Tracked;

namespace
{
// oldest first, via a cursor
template <class T>
std::vector<T> drain_copy(rc::ring_queue<T> const& q)
{
    std::vector<T> out;
    auto c = q.make_cursor();
    while (c.move_next().value())
        out.push_back(c.current());
    return out;
}

bool holds(rc::ring_queue<int> const& q, std::initializer_list<int> expected)
{
    return drain_copy(q) == std::vector<int>(expected);
}

// queue of the given capacity whose live range wraps around the end of the store
// e.g. capacity 4 with {3, 4, 5}: slots [5, _, 3, 4], front 2, back 1
rc::ring_queue<int> make_wrapped(rc::isize capacity, rc::isize front_offset, std::initializer_list<int> values)
{
    auto q = rc::ring_queue<int>::create(capacity).value();
    for (auto i = 0; i < front_offset; ++i)
        q.push(-1);
    for (auto i = 0; i < front_offset; ++i)
        (void)q.pop().value();
    for (auto v : values)
        q.push(v);
    return q;
}
} // namespace

TEST("ring_queue - create")
{
    SECTION("default capacity")
    {
        auto q = rc::ring_queue<int>::create().value();
        CHECK(q.capacity() == 50);
        CHECK(q.capacity() == rc::ring_queue<int>::default_capacity);
        CHECK(q.count() == 0);
        CHECK(q.is_empty());
        CHECK(q.generation() == 0);
        CHECK(q.resource() == nullptr);
    }

    SECTION("explicit capacity")
    {
        auto q = rc::ring_queue<int>::create(7).value();
        CHECK(q.capacity() == 7);
        CHECK(q.is_empty());
    }

    SECTION("non-positive capacity is rejected")
    {
        auto zero = rc::ring_queue<int>::create(0);
        REQUIRE(zero.has_error());
        CHECK(zero.error() == rc::queue_error::invalid_argument);

        auto negative = rc::ring_queue<int>::create(-3);
        REQUIRE(negative.has_error());
        CHECK(negative.error() == rc::queue_error::invalid_argument);

        auto from = rc::ring_queue<int>::create_from({1, 2}, 0);
        REQUIRE(from.has_error());
        CHECK(from.error() == rc::queue_error::invalid_argument);
    }

    SECTION("custom resource")
    {
        CountingResource res;
        {
            auto q = rc::ring_queue<int>::create(8, &res).value();
            CHECK(q.resource() == &res);
            CHECK(res.allocations == 1);
            CHECK(res.total_allocated_bytes == 8 * rc::isize(sizeof(int)));
        }
        CHECK(res.live_allocations() == 0);
    }
}

TEST("ring_queue - create_from")
{
    SECTION("initializer list")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2, 3, 2}, 1).value();
        CHECK(q.count() == 4);
        CHECK(q.capacity() == 4); // 1 -> 2 -> 4
        CHECK(holds(q, {1, 2, 3, 2}));
    }

    SECTION("vector round trip")
    {
        auto const source = std::vector<int>{5, 4, 3, 2, 1, 0};
        auto q = rc::ring_queue<int>::create_from(source).value();
        CHECK(q.capacity() == 50);
        auto const same = drain_copy(q) == source;
        CHECK(same);
    }

    SECTION("empty source")
    {
        auto q = rc::ring_queue<int>::create_from(std::vector<int>{}, 3).value();
        CHECK(q.is_empty());
        CHECK(q.capacity() == 3);
    }

    SECTION("moves out of rvalue ranges of move-only elements")
    {
        std::vector<MoveOnly> source;
        source.emplace_back(1);
        source.emplace_back(2);

        auto q = rc::ring_queue<MoveOnly>::create_from(source | std::views::as_rvalue, 1).value();
        CHECK(q.count() == 2);
        CHECK(q.front().value().value == 1);
        CHECK(source[0].value == -1);
    }

    SECTION("converting elements")
    {
        auto const words = std::vector<char const*>{"a", "bc"};
        auto q = rc::ring_queue<std::string>::create_from(words).value();
        CHECK(q.pop().value() == "a");
        CHECK(q.pop().value() == "bc");
    }
}

TEST("ring_queue - push and pop")
{
    SECTION("FIFO order")
    {
        auto q = rc::ring_queue<int>::create(4).value();
        q.push(1);
        q.push(2);
        q.push(3);
        CHECK(q.count() == 3);

        CHECK(q.pop().value() == 1);
        CHECK(q.pop().value() == 2);
        q.push(4);
        CHECK(q.pop().value() == 3);
        CHECK(q.pop().value() == 4);
        CHECK(q.is_empty());
    }

    SECTION("push returns the new element")
    {
        auto q = rc::ring_queue<int>::create(2).value();
        auto& a = q.push(10);
        a = 11;
        CHECK(q.front().value() == 11);

        auto& b = q.emplace(20);
        CHECK(b == 20);
        CHECK(q.count() == 2);
    }

    SECTION("pop on an empty queue")
    {
        auto q = rc::ring_queue<int>::create(2).value();
        auto const gen = q.generation();

        auto r = q.pop();
        REQUIRE(r.has_error());
        CHECK(r.error() == rc::queue_error::empty_queue);
        CHECK(q.generation() == gen);
        CHECK(q.count() == 0);

        q.push(1);
        (void)q.pop().value();
        CHECK(q.pop().error() == rc::queue_error::empty_queue);
    }

    SECTION("front")
    {
        auto q = rc::ring_queue<int>::create(2).value();
        CHECK(q.front().error() == rc::queue_error::empty_queue);

        q.push(7);
        q.push(8);
        CHECK(q.front().value() == 7);
        CHECK(q.count() == 2); // not removed

        q.front().value() = 70;
        CHECK(q.pop().value() == 70);

        auto const& cq = q;
        CHECK(cq.front().value() == 8);
    }

    SECTION("many operations stay consistent")
    {
        auto q = rc::ring_queue<int>::create(3).value();
        auto next_in = 0;
        auto next_out = 0;
        for (auto round = 0; round < 200; ++round)
        {
            // push two, pop one: drifts the live range through every slot
            q.push(next_in++);
            q.push(next_in++);
            CHECK(q.pop().value() == next_out++);
        }
        CHECK(q.count() == next_in - next_out);
        while (!q.is_empty())
            CHECK(q.pop().value() == next_out++);
        CHECK(next_out == next_in);
    }
}

TEST("ring_queue - growth")
{
    SECTION("capacity 1 grows without losing elements")
    {
        auto q = rc::ring_queue<int>::create(1).value();
        for (auto i = 0; i < 9; ++i)
            q.push(i);

        CHECK(q.count() == 9);
        CHECK(q.capacity() == 16);
        CHECK(holds(q, {0, 1, 2, 3, 4, 5, 6, 7, 8}));
    }

    SECTION("grown capacity")
    {
        CHECK(rc::impl::grown_ring_capacity(0) == 1);
        CHECK(rc::impl::grown_ring_capacity(1) == 2);
        CHECK(rc::impl::grown_ring_capacity(50) == 100);

        auto const largest = std::numeric_limits<rc::isize>::max() / 2;
        CHECK(rc::impl::grown_ring_capacity(largest) == 2 * largest);

        auto const overflow = rc_test::capture_assertion([&] { (void)rc::impl::grown_ring_capacity(largest + 1); });
        REQUIRE(overflow.has_value());
        CHECK(overflow->message == "ring_queue capacity cannot be doubled without overflow");
    }

    SECTION("capacity doubles only when full")
    {
        auto q = rc::ring_queue<int>::create(3).value();
        q.push(1);
        q.push(2);
        q.push(3);
        CHECK(q.capacity() == 3);
        q.push(4);
        CHECK(q.capacity() == 6);
    }

    SECTION("wrapped live range is compacted in order")
    {
        auto q = make_wrapped(4, 3, {1, 2, 3, 4}); // slots [2, 3, 4, 1], front 3
        CHECK(q.capacity() == 4);

        q.push(5);
        CHECK(q.capacity() == 8);
        CHECK(holds(q, {1, 2, 3, 4, 5}));

        // continues to behave like a queue
        q.push(6);
        CHECK(q.pop().value() == 1);
        CHECK(holds(q, {2, 3, 4, 5, 6}));
    }

    SECTION("pushing an element of the queue itself while full")
    {
        auto q = make_wrapped(2, 1, {1, 2});
        q.push(q.front().value());
        CHECK(holds(q, {1, 2, 1}));

        auto s = rc::ring_queue<std::string>::create(1).value();
        s.push(std::string(100, 'x'));
        s.push(s.front().value());
        CHECK(s.count() == 2);
        CHECK(s.pop().value() == std::string(100, 'x'));
        CHECK(s.pop().value() == std::string(100, 'x'));
    }

    SECTION("store is never shrunk")
    {
        auto q = rc::ring_queue<int>::create(1).value();
        for (auto i = 0; i < 5; ++i)
            q.push(i);
        while (!q.is_empty())
            (void)q.pop().value();
        CHECK(q.capacity() == 8);
    }

    SECTION("old stores are returned to the resource")
    {
        CountingResource res;
        {
            auto q = rc::ring_queue<int>::create(1, &res).value();
            for (auto i = 0; i < 5; ++i)
                q.push(i); // 1 -> 2 -> 4 -> 8

            CHECK(res.allocations == 4);
            CHECK(res.deallocations == 3);
            CHECK(res.live_allocations() == 1);
        }
        CHECK(res.live_allocations() == 0);
        CHECK(res.total_allocated_bytes == res.total_deallocated_bytes);
    }
}

TEST("ring_queue - copy_to")
{
    SECTION("copies into the middle of the destination")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2, 3, 2}, 1).value();
        int dest[] = {0, 0, 0, 0, 0, 0};

        REQUIRE(q.copy_to(rc::span<int>(dest), 1).has_value());
        CHECK(dest[0] == 0);
        CHECK(dest[1] == 1);
        CHECK(dest[2] == 2);
        CHECK(dest[3] == 3);
        CHECK(dest[4] == 2);
        CHECK(dest[5] == 0);
        CHECK(q.count() == 4);
    }

    SECTION("wrapped live range")
    {
        auto q = make_wrapped(4, 2, {3, 4, 5}); // slots [5, _, 3, 4]
        auto dest = std::vector<int>(3, 0);

        REQUIRE(q.copy_to(rc::span<int>(dest), 0).has_value());
        CHECK(dest[0] == 3);
        CHECK(dest[1] == 4);
        CHECK(dest[2] == 5);
    }

    SECTION("full and wrapped live range")
    {
        auto q = make_wrapped(3, 2, {1, 2, 3}); // slots [2, 3, 1], front == back == 2
        REQUIRE(q.count() == q.capacity());
        int dest[] = {0, 0, 0, 0};

        REQUIRE(q.copy_to(rc::span<int>(dest), 1).has_value());
        CHECK(dest[0] == 0);
        CHECK(dest[1] == 1);
        CHECK(dest[2] == 2);
        CHECK(dest[3] == 3);

        CHECK(q.copy_to(rc::span<int>(dest), 2).error() == rc::queue_error::insufficient_capacity);
        CHECK(dest[3] == 3);
    }

    SECTION("exact fit at the end")
    {
        auto q = rc::ring_queue<int>::create_from({8, 9}).value();
        int dest[] = {0, 0, 0, 0};
        REQUIRE(q.copy_to(rc::span<int>(dest), 2).has_value());
        CHECK(dest[1] == 0);
        CHECK(dest[2] == 8);
        CHECK(dest[3] == 9);
    }

    SECTION("empty queue copies nothing")
    {
        auto q = rc::ring_queue<int>::create(2).value();
        int dest[] = {4, 4};
        REQUIRE(q.copy_to(rc::span<int>(dest), 1).has_value());
        CHECK(dest[0] == 4);
        CHECK(dest[1] == 4);
    }

    SECTION("errors leave the destination untouched")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2, 3}).value();
        int dest[] = {7, 7, 7, 7};
        auto const untouched = [&] { return dest[0] == 7 && dest[1] == 7 && dest[2] == 7 && dest[3] == 7; };

        CHECK(q.copy_to(rc::span<int>(dest), -1).error() == rc::queue_error::index_out_of_range);
        CHECK(untouched());

        CHECK(q.copy_to(rc::span<int>(dest), 4).error() == rc::queue_error::index_out_of_range);
        CHECK(untouched());

        CHECK(q.copy_to(rc::span<int>(dest), 2).error() == rc::queue_error::insufficient_capacity);
        CHECK(untouched());

        CHECK(q.copy_to(rc::span<int>(), 0).error() == rc::queue_error::index_out_of_range);

        auto empty = rc::ring_queue<int>::create(1).value();
        CHECK(empty.copy_to(rc::span<int>(), 0).error() == rc::queue_error::index_out_of_range);
    }

    SECTION("copies are independent of the queue")
    {
        auto q = rc::ring_queue<std::string>::create_from({"a", "b"}).value();
        auto dest = std::vector<std::string>(2);
        REQUIRE(q.copy_to(rc::span<std::string>(dest), 0).has_value());

        q.front().value() = "changed";
        CHECK(dest[0] == "a");
        CHECK(dest[1] == "b");
    }
}

TEST("ring_queue - cursor")
{
    SECTION("visits the elements oldest first")
    {
        auto q = make_wrapped(4, 3, {1, 2, 3});
        auto c = q.make_cursor();

        REQUIRE(c.move_next().value());
        CHECK(c.current() == 1);
        REQUIRE(c.move_next().value());
        CHECK(c.current() == 2);
        REQUIRE(c.move_next().value());
        CHECK(c.current() == 3);
        CHECK(!c.move_next().value());
    }

    SECTION("full queue is traversed exactly once")
    {
        auto q = make_wrapped(3, 2, {1, 2, 3}); // front == back
        CHECK(q.count() == q.capacity());
        CHECK(holds(q, {1, 2, 3}));
    }

    SECTION("exhausted cursor keeps returning false")
    {
        auto q = rc::ring_queue<int>::create_from({1}).value();
        auto c = q.make_cursor();
        CHECK(c.move_next().value());
        CHECK(!c.move_next().value());
        CHECK(!c.move_next().value());
        CHECK(!c.move_next().value());
    }

    SECTION("empty queue")
    {
        auto q = rc::ring_queue<int>::create(2).value();
        auto c = q.make_cursor();
        CHECK(!c.move_next().value());
    }

    SECTION("current allows mutation through a non-const cursor")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2}).value();
        auto c = q.make_cursor();
        while (c.move_next().value())
            c.current() *= 10;
        CHECK(holds(q, {10, 20}));
        CHECK(q.generation() == 2); // element writes are not structural modifications
    }

    SECTION("push invalidates the cursor")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2}).value();
        auto c = q.make_cursor();
        REQUIRE(c.move_next().value());

        q.push(3);
        auto r = c.move_next();
        REQUIRE(r.has_error());
        CHECK(r.error() == rc::queue_error::concurrent_modification);
    }

    SECTION("pop invalidates the cursor")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2}).value();
        auto c = q.make_cursor();

        (void)q.pop().value();
        CHECK(c.move_next().error() == rc::queue_error::concurrent_modification);
        CHECK(c.reset().error() == rc::queue_error::concurrent_modification);
        CHECK(c.move_next().error() == rc::queue_error::concurrent_modification);
    }

    SECTION("failed pop does not invalidate")
    {
        auto q = rc::ring_queue<int>::create(2).value();
        auto c = q.make_cursor();
        CHECK(q.pop().has_error());
        CHECK(c.move_next().has_value());
    }

    SECTION("reset restarts the traversal")
    {
        auto q = rc::ring_queue<int>::create_from({4, 5}).value();
        auto c = q.make_cursor();
        while (c.move_next().value())
        {
        }

        REQUIRE(c.reset().has_value());
        REQUIRE(c.move_next().value());
        CHECK(c.current() == 4);
    }

    SECTION("cursors are independent")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2, 3}).value();
        auto a = q.make_cursor();
        auto b = q.make_cursor();

        REQUIRE(a.move_next().value());
        REQUIRE(a.move_next().value());
        REQUIRE(b.move_next().value());
        CHECK(a.current() == 2);
        CHECK(b.current() == 1);
    }

#if RC_ASSERT_ENABLED
    SECTION("current without an element asserts")
    {
        auto q = rc::ring_queue<int>::create_from({1}).value();
        auto c = q.make_cursor();

        auto const before = rc_test::capture_assertion([&] { (void)c.current(); });
        REQUIRE(before.has_value());
        CHECK(before->message == "cursor is not positioned on an element");

        REQUIRE(c.move_next().value());
        CHECK(!rc_test::capture_assertion([&] { (void)c.current(); }).has_value());

        CHECK(!c.move_next().value());
        auto const after = rc_test::capture_assertion([&] { (void)c.current(); });
        REQUIRE(after.has_value());
        CHECK(after->message == "cursor is not positioned on an element");
    }

    SECTION("current after modification asserts")
    {
        auto q = rc::ring_queue<int>::create_from({1}).value();
        auto c = q.make_cursor();
        REQUIRE(c.move_next().value());

        q.push(2);
        auto const failure = rc_test::capture_assertion([&] { (void)c.current(); });
        REQUIRE(failure.has_value());
        CHECK(failure->message == "queue was modified after the cursor was positioned");
    }
#endif
}

TEST("ring_queue - range-for")
{
    SECTION("visits the elements oldest first")
    {
        auto q = make_wrapped(5, 4, {1, 2, 3, 4});
        auto seen = std::vector<int>{};
        for (auto v : q)
            seen.push_back(v);
        auto const in_order = seen == std::vector<int>{1, 2, 3, 4};
        CHECK(in_order);
    }

    SECTION("const queue")
    {
        auto const q = rc::ring_queue<int>::create_from({3, 1}).value();
        auto sum = 0;
        for (auto const& v : q)
            sum += v;
        CHECK(sum == 4);
    }

    SECTION("mutable access")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2, 3}).value();
        for (auto& v : q)
            v += 1;
        CHECK(holds(q, {2, 3, 4}));
    }

    SECTION("modification during iteration asserts")
    {
        auto q = rc::ring_queue<int>::create_from({1, 2, 3}).value();

        auto const failure = rc_test::capture_assertion(
            [&]
            {
                for (auto v : q)
                    if (v == 1)
                        q.push(4);
            });
        REQUIRE(failure.has_value());
        CHECK(failure->message == "ring_queue was modified during iteration");
        CHECK(q.count() == 4);
    }
}

TEST("ring_queue - generation")
{
    auto q = rc::ring_queue<int>::create(2).value();
    CHECK(q.generation() == 0);

    q.push(1);
    q.push(2);
    q.push(3); // grows
    CHECK(q.generation() == 3);

    (void)q.pop().value();
    CHECK(q.generation() == 4);

    SECTION("read-only operations do not change it")
    {
        (void)q.front();
        (void)q.count();
        (void)q.is_empty();
        int dest[] = {0, 0};
        (void)q.copy_to(rc::span<int>(dest), 0);
        for (auto v : q)
            (void)v;
        (void)drain_copy(q);
        CHECK(q.generation() == 4);
    }
}

TEST("ring_queue - value semantics")
{
    SECTION("copy is deep and compacted")
    {
        auto q = make_wrapped(4, 3, {1, 2, 3});
        auto c = q;

        CHECK(c.capacity() == 4);
        CHECK(c.count() == 3);
        CHECK(c.generation() == 0);
        CHECK(holds(c, {1, 2, 3}));

        q.front().value() = 100;
        CHECK(c.front().value() == 1);
    }

    SECTION("copy uses the same resource")
    {
        CountingResource res;
        {
            auto q = rc::ring_queue<int>::create_from({1, 2}, 4, &res).value();
            auto c = q;
            CHECK(c.resource() == &res);
            CHECK(res.allocations == 2);
        }
        CHECK(res.live_allocations() == 0);
    }

    SECTION("copy assignment")
    {
        auto a = rc::ring_queue<int>::create_from({1, 2, 3}).value();
        auto b = rc::ring_queue<int>::create_from({9}, 1).value();
        b = a;
        CHECK(holds(b, {1, 2, 3}));
        CHECK(holds(a, {1, 2, 3}));

        b = b;
        CHECK(holds(b, {1, 2, 3}));
    }

    SECTION("move leaves an empty queue that can be reused")
    {
        auto a = rc::ring_queue<int>::create_from({1, 2}, 2).value();
        auto const gen = a.generation();

        auto b = rc::move(a);
        CHECK(holds(b, {1, 2}));
        CHECK(b.capacity() == 2);
        CHECK(b.generation() == gen);

        CHECK(a.is_empty());
        CHECK(a.capacity() == 0);
        CHECK(a.pop().error() == rc::queue_error::empty_queue);
        CHECK(a.front().error() == rc::queue_error::empty_queue);

        // zero slots is still a consistent empty queue
        auto c = a.make_cursor();
        CHECK(!c.move_next().value());
        int dest[] = {9};
        REQUIRE(a.copy_to(rc::span<int>(dest), 0).has_value());
        CHECK(dest[0] == 9);

        a.push(5);
        CHECK(a.capacity() == 1);
        CHECK(holds(a, {5}));
    }

    SECTION("move invalidates cursors on the source")
    {
        auto a = rc::ring_queue<int>::create_from({1, 2}).value();
        auto c = a.make_cursor();
        auto b = rc::move(a);
        CHECK(c.move_next().error() == rc::queue_error::concurrent_modification);
        CHECK(b.count() == 2);
    }

    SECTION("move assignment")
    {
        CountingResource res;
        {
            auto a = rc::ring_queue<int>::create_from({1, 2}, 2, &res).value();
            auto b = rc::ring_queue<int>::create_from({3}, 1, &res).value();
            auto const gen_b = b.generation();

            b = rc::move(a);
            CHECK(holds(b, {1, 2}));
            CHECK(b.generation() != gen_b);
            CHECK(a.capacity() == 0);
            CHECK(res.live_allocations() == 1);
        }
        CHECK(res.live_allocations() == 0);
    }

    SECTION("move-only elements")
    {
        auto q = rc::ring_queue<MoveOnly>::create(1).value();
        q.push(MoveOnly(1));
        q.emplace(2);
        q.emplace(3);
        CHECK(q.capacity() == 4);

        auto moved = rc::move(q);
        CHECK(moved.pop().value().value == 1);
        CHECK(moved.front().value().value == 2);
        static_assert(!std::is_copy_constructible_v<rc::ring_queue<MoveOnly>>);
    }
}

TEST("ring_queue - element lifetime")
{
    Tracked::reset_counters();

    SECTION("every constructed element is destroyed exactly once")
    {
        {
            auto q = rc::ring_queue<Tracked>::create(1).value();
            for (auto i = 0; i < 10; ++i)
                q.emplace(i);
            for (auto i = 0; i < 4; ++i)
                CHECK(q.pop().value().value == i);
            q.emplace(10);

            auto copy = q;
            auto moved = rc::move(q);
            CHECK(Tracked::alive() == 14);
        }
        CHECK(Tracked::alive() == 0);
    }

    SECTION("pop leaves no object behind")
    {
        auto q = rc::ring_queue<Tracked>::create(2).value();
        q.emplace(1);
        q.emplace(2);
        {
            auto r = q.pop();
            CHECK(Tracked::alive() == 2); // one in the queue, one in the result
        }
        CHECK(Tracked::alive() == 1);
    }

    SECTION("destruction order is newest first")
    {
        std::vector<int> order;
        {
            auto t = rc::ring_queue<Tracked>::create(3).value();
            t.emplace(0);
            t.emplace(0);
            (void)t.pop().value();
            (void)t.pop().value();
            t.emplace(1); // slot 2
            t.emplace(2); // slot 0
            t.emplace(3); // slot 1
            Tracked::destruction_order = &order;
        }
        Tracked::destruction_order = nullptr;
        auto const newest_first = order == std::vector<int>{3, 2, 1};
        CHECK(newest_first);
    }

    Tracked::reset_counters();
}

TEST("ring_queue - throwing elements")
{
    ThrowsOnCopy::fail_copies = false;
    ThrowsOnCopy::alive = 0;

    SECTION("failed push during growth leaves the queue unchanged")
    {
        auto q = rc::ring_queue<ThrowsOnCopy>::create(2).value();
        q.emplace(1);
        q.emplace(2);

        auto const extra = ThrowsOnCopy(3);
        ThrowsOnCopy::fail_copies = true;
        auto threw = false;
        try
        {
            q.push(extra);
        }
        catch (rc_test::copy_failure const&)
        {
            threw = true;
        }
        ThrowsOnCopy::fail_copies = false;

        CHECK(threw);
        CHECK(q.count() == 2);
        CHECK(q.capacity() == 2);
        CHECK(q.pop().value().value == 1);
        CHECK(q.pop().value().value == 2);
    }

    SECTION("failed push without growth leaves the queue unchanged")
    {
        auto q = rc::ring_queue<ThrowsOnCopy>::create(4).value();
        q.emplace(1);

        auto const extra = ThrowsOnCopy(2);
        ThrowsOnCopy::fail_copies = true;
        auto threw = false;
        try
        {
            q.push(extra);
        }
        catch (rc_test::copy_failure const&)
        {
            threw = true;
        }
        ThrowsOnCopy::fail_copies = false;

        CHECK(threw);
        CHECK(q.count() == 1);
        q.emplace(5);
        CHECK(q.count() == 2);
    }

    SECTION("failed queue copy releases everything")
    {
        CountingResource res;
        {
            auto q = rc::ring_queue<ThrowsOnCopy>::create(4, &res).value();
            q.emplace(1);
            q.emplace(2);
            auto const alive_before = ThrowsOnCopy::alive;

            ThrowsOnCopy::fail_copies = true;
            auto threw = false;
            try
            {
                auto copy = q;
                (void)copy;
            }
            catch (rc_test::copy_failure const&)
            {
                threw = true;
            }
            ThrowsOnCopy::fail_copies = false;

            CHECK(threw);
            CHECK(ThrowsOnCopy::alive == alive_before);
            CHECK(res.live_allocations() == 1);
        }
        CHECK(res.live_allocations() == 0);
    }

    CHECK(ThrowsOnCopy::alive == 0);
}

TEST("ring_queue - queue_error names")
{
    CHECK(std::string(rc::to_string(rc::queue_error::invalid_argument)) == "invalid_argument");
    CHECK(std::string(rc::to_string(rc::queue_error::null_source)) == "null_source");
    CHECK(std::string(rc::to_string(rc::queue_error::null_destination)) == "null_destination");
    CHECK(std::string(rc::to_string(rc::queue_error::empty_queue)) == "empty_queue");
    CHECK(std::string(rc::to_string(rc::queue_error::index_out_of_range)) == "index_out_of_range");
    CHECK(std::string(rc::to_string(rc::queue_error::insufficient_capacity)) == "insufficient_capacity");
    CHECK(std::string(rc::to_string(rc::queue_error::concurrent_modification)) == "concurrent_modification");
    CHECK(std::string(rc::to_string(rc::queue_error(200))) == "unknown queue_error");
}
