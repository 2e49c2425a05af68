#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

#include <concepts>
#include <cstddef>

/// Mutable window onto caller-owned elements, the destination of rc::ring_queue::copy_to.
///
/// A span is a pointer and an element count, nothing else: it never allocates or frees, and copying
/// one copies the window, not the elements. An empty span (default constructed, or built from an
/// empty container) has size 0 and possibly a null data() pointer, which copy_to rejects by size.
///
///     int buffer[8] = {};
///     q.copy_to(rc::span<int>(buffer), 2);              // C array
///
///     auto values = std::vector<std::string>(q.count());
///     q.copy_to(rc::span<std::string>(values), 0);      // anything with data() and size()
template <class T>
struct rc::span
{
public:
    constexpr span() = default;

    /// Views first[0], ..., first[count - 1].
    constexpr span(T* first, isize count) : _data(first), _size(count)
    {
        RC_ASSERT(count >= 0, "span element count must be non-negative");
        RC_ASSERT(first != nullptr || count == 0, "non-empty span over nullptr");
    }

    template <std::size_t N>
    constexpr span(T (&elements)[N]) : _data(elements), _size(isize(N)) // NOLINT
    {
    }

    /// The container must outlive the span and must not reallocate while it is in use.
    template <class Container>
        requires requires(Container& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<std::size_t>;
        }
    constexpr explicit span(Container& elements) : _data(elements.data()), _size(isize(elements.size()))
    {
    }

public:
    [[nodiscard]] constexpr T* data() const { return _data; }
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < _size, "span index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

private:
    T* _data = nullptr;
    isize _size = 0;
};
