#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <type_traits>

// =========================================================================================================
// rc::result<T, E> - sum type for expected errors
// =========================================================================================================
//
// A result holds either a value of type T or an error of type E, never both and never neither.
// It is the return type of every ring-core operation that can fail for reasons the caller is
// expected to handle (popping an empty queue, copying into a too-small buffer, ...).
//
// Usage:
//
//     auto parse_digit = [](char c) -> rc::result<int, std::string>
//     {
//         if (c < '0' || c > '9')
//             return rc::error("not a digit");
//         return c - '0';
//     };
//
//     auto r = q.pop();
//     if (r.has_error())
//         return r.error(); // e.g. rc::queue_error::empty_queue
//     use(r.value());
//
// Design notes:
// - there is no operator*, operator-> or operator bool: access is always spelled out
// - value() and error() assert the matching state
// - a default constructed result holds a default constructed error
// - result<T, E> is trivially copyable/destructible when T and E are
// - result<void, E> is for operations without a value, its default state is success
// - result<T&, E> refers to an existing object and never copies it

/// Wrapper marking a value as "the error" so that result<T, E> can be built unambiguously even when T == E.
/// Created via rc::error(e), see below.
template <class E>
struct rc::as_error_t
{
    E value;
};

namespace rc
{
/// Marks a value as error for constructing a result.
/// Usage:
///   return rc::error(rc::queue_error::empty_queue);
///   return rc::error("division by zero"); // for result<T, std::string>
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return as_error_t<std::decay_t<E>>{rc::forward<E>(e)};
}

namespace impl
{
template <class T>
struct is_result : std::false_type
{
};
template <class T, class E>
struct is_result<rc::result<T, E>> : std::true_type
{
};

template <class T>
struct is_as_error : std::false_type
{
};
template <class E>
struct is_as_error<rc::as_error_t<E>> : std::true_type
{
};

template <class U>
concept not_result_or_error
    = !is_result<std::remove_cvref_t<U>>::value && !is_as_error<std::remove_cvref_t<U>>::value;
} // namespace impl
} // namespace rc

template <class T, class E>
struct rc::result
{
    static_assert(!std::is_same_v<std::remove_cv_t<T>, rc::nullptr_t>, "result<nullptr_t, E> is not supported");

    static constexpr bool is_trivially_copyable = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;
    static constexpr bool is_trivially_destructible
        = std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>;

    // construction
public:
    /// Default result holds a default constructed error.
    constexpr result()
        requires std::is_default_constructible_v<E>
      : _error(), _has_value(false)
    {
    }

    /// Constructs a result holding a value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires impl::not_result_or_error<U> && std::is_constructible_v<T, U&&>
    explicit(!std::is_convertible_v<U&&, T>) constexpr result(U&& value) // NOLINT
      : _value(rc::forward<U>(value)), _has_value(true)
    {
    }

    /// Constructs a result holding an error from rc::error(...).
    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(as_error_t<G>&& err) // NOLINT
      : _error(rc::move(err.value)), _has_value(false)
    {
    }
    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& err) // NOLINT
      : _error(err.value), _has_value(false)
    {
    }

    /// Converts from a result with compatible value and error types.
    /// Usage:
    ///   auto r = rc::result<long, long>{rc::result<int, int>{42}};
    template <class U, class G>
        requires(!std::is_same_v<result<U, G>, result> && std::is_constructible_v<T, U&&> && std::is_constructible_v<E, G &&>)
    explicit(!std::is_convertible_v<U&&, T> || !std::is_convertible_v<G&&, E>) constexpr result(result<U, G>&& rhs)
    {
        if (rhs.has_value())
            impl_construct_value(rc::move(rhs).value());
        else
            impl_construct_error(rc::move(rhs).error());
    }
    template <class U, class G>
        requires(!std::is_same_v<result<U, G>, result> && std::is_constructible_v<T, U const&>
                 && std::is_constructible_v<E, G const&>)
    explicit(!std::is_convertible_v<U const&, T> || !std::is_convertible_v<G const&, E>) constexpr result(result<U, G> const& rhs)
    {
        if (rhs.has_value())
            impl_construct_value(rhs.value());
        else
            impl_construct_error(rhs.error());
    }

    // trivial copy/move/destroy - defaulted when T and E allow bitwise operations
public:
    result(result&&)
        requires is_trivially_copyable
    = default;
    result(result const&)
        requires is_trivially_copyable
    = default;
    result& operator=(result&&)
        requires is_trivially_copyable
    = default;
    result& operator=(result const&)
        requires is_trivially_copyable
    = default;

    ~result()
        requires is_trivially_destructible
    = default;

    // non-trivial copy/move/destroy
public:
    /// Move-constructs the active member. rhs keeps its state with a moved-from object.
    result(result&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (rhs._has_value)
            impl_construct_value(rc::move(rhs._value));
        else
            impl_construct_error(rc::move(rhs._error));
    }

    result(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (rhs._has_value)
            impl_construct_value(rhs._value);
        else
            impl_construct_error(rhs._error);
    }

    /// Assigns member-wise when both hold the same alternative, otherwise destroys and reconstructs.
    result& operator=(result&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (this == &rhs)
            return *this;

        if (_has_value && rhs._has_value)
            _value = rc::move(rhs._value);
        else if (!_has_value && !rhs._has_value)
            _error = rc::move(rhs._error);
        else
        {
            impl_destroy();
            if (rhs._has_value)
                impl_construct_value(rc::move(rhs._value));
            else
                impl_construct_error(rc::move(rhs._error));
        }

        return *this;
    }

    result& operator=(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>
                 && std::is_copy_assignable_v<T> && std::is_copy_assignable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_has_value && rhs._has_value)
            _value = rhs._value;
        else if (!_has_value && !rhs._has_value)
            _error = rhs._error;
        else
        {
            impl_destroy();
            if (rhs._has_value)
                impl_construct_value(rhs._value);
            else
                impl_construct_error(rhs._error);
        }

        return *this;
    }

    ~result()
        requires(!is_trivially_destructible)
    {
        impl_destroy();
    }

    // queries
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    // access
public:
    /// Precondition: has_value()
    [[nodiscard]] constexpr T& value() &
    {
        RC_ASSERT(_has_value, "attempted to access value of result holding an error");
        return _value;
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        RC_ASSERT(_has_value, "attempted to access value of result holding an error");
        return _value;
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        RC_ASSERT(_has_value, "attempted to access value of result holding an error");
        return rc::move(_value);
    }

    /// Precondition: has_error()
    [[nodiscard]] constexpr E& error() &
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return rc::move(_error);
    }

    /// Returns the value or the given fallback if this holds an error.
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const&
    {
        return _has_value ? _value : static_cast<T>(rc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) &&
    {
        return _has_value ? rc::move(_value) : static_cast<T>(rc::forward<U>(fallback));
    }

    /// Returns the error or the given fallback if this holds a value.
    template <class G>
    [[nodiscard]] constexpr E error_or(G&& fallback) const&
    {
        return _has_value ? static_cast<E>(rc::forward<G>(fallback)) : _error;
    }
    template <class G>
    [[nodiscard]] constexpr E error_or(G&& fallback) &&
    {
        return _has_value ? static_cast<E>(rc::forward<G>(fallback)) : rc::move(_error);
    }

    // modification
public:
    /// Destroys the current content and constructs a value in place.
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        impl_destroy();
        impl_construct_value(rc::forward<Args>(args)...);
        return _value;
    }

    /// Destroys the current content and constructs an error in place.
    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        impl_destroy();
        impl_construct_error(rc::forward<Args>(args)...);
        return _error;
    }

    // helper
private:
    template <class... Args>
    void impl_construct_value(Args&&... args)
    {
        new (rc::placement_new, &_value) T(rc::forward<Args>(args)...);
        _has_value = true;
    }

    template <class... Args>
    void impl_construct_error(Args&&... args)
    {
        new (rc::placement_new, &_error) E(rc::forward<Args>(args)...);
        _has_value = false;
    }

    void impl_destroy()
    {
        if (_has_value)
            _value.~T();
        else
            _error.~E();
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value = false;

    template <class, class>
    friend struct rc::result;
};

/// Result of an operation that produces no value.
/// The default constructed state is success so that `return {};` reads naturally.
template <class E>
struct rc::result<void, E>
{
    static constexpr bool is_trivially_copyable = std::is_trivially_copyable_v<E>;
    static constexpr bool is_trivially_destructible = std::is_trivially_destructible_v<E>;

    // construction
public:
    constexpr result() : _dummy(), _has_value(true) {}

    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(as_error_t<G>&& err) // NOLINT
      : _error(rc::move(err.value)), _has_value(false)
    {
    }
    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& err) // NOLINT
      : _error(err.value), _has_value(false)
    {
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires is_trivially_copyable
    = default;
    result(result const&)
        requires is_trivially_copyable
    = default;
    result& operator=(result&&)
        requires is_trivially_copyable
    = default;
    result& operator=(result const&)
        requires is_trivially_copyable
    = default;

    ~result()
        requires is_trivially_destructible
    = default;

    // non-trivial copy/move/destroy
public:
    result(result&& rhs) noexcept
        requires(!is_trivially_copyable)
      : _dummy(), _has_value(true)
    {
        if (!rhs._has_value)
            impl_construct_error(rc::move(rhs._error));
    }

    result(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<E>)
      : _dummy(), _has_value(true)
    {
        if (!rhs._has_value)
            impl_construct_error(rhs._error);
    }

    result& operator=(result&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (this == &rhs)
            return *this;

        if (!_has_value && !rhs._has_value)
            _error = rc::move(rhs._error);
        else
        {
            impl_destroy();
            if (!rhs._has_value)
                impl_construct_error(rc::move(rhs._error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<E> && std::is_copy_assignable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (!_has_value && !rhs._has_value)
            _error = rhs._error;
        else
        {
            impl_destroy();
            if (!rhs._has_value)
                impl_construct_error(rhs._error);
        }
        return *this;
    }

    ~result()
        requires(!is_trivially_destructible)
    {
        impl_destroy();
    }

    // queries
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    // access
public:
    /// Asserts success. Useful to document that an operation cannot fail at this call site.
    constexpr void value() const { RC_ASSERT(_has_value, "attempted to access value of result holding an error"); }

    [[nodiscard]] constexpr E& error() &
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return rc::move(_error);
    }

    template <class G>
    [[nodiscard]] constexpr E error_or(G&& fallback) const&
    {
        return _has_value ? static_cast<E>(rc::forward<G>(fallback)) : _error;
    }

    // modification
public:
    void emplace_value()
    {
        impl_destroy();
        _has_value = true;
    }

    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        impl_destroy();
        impl_construct_error(rc::forward<Args>(args)...);
        return _error;
    }

    // helper
private:
    template <class... Args>
    void impl_construct_error(Args&&... args)
    {
        new (rc::placement_new, &_error) E(rc::forward<Args>(args)...);
        _has_value = false;
    }

    void impl_destroy()
    {
        if (!_has_value)
        {
            _error.~E();
            _has_value = true;
        }
    }

    // members
private:
    union
    {
        char _dummy;
        E _error;
    };
    bool _has_value = true;
};

/// Result referring to an existing object.
/// Holds a pointer internally; value() returns the referenced object, never a copy.
/// A const result<T&, E> still grants T& access (like a pointer, constness is part of T).
/// Usage:
///   auto r = q.front();           // result<T&, queue_error>
///   if (r.has_value())
///       r.value().touch();        // mutates the element inside the queue
template <class T, class E>
struct rc::result<T&, E>
{
    static constexpr bool is_trivially_copyable = std::is_trivially_copyable_v<E>;
    static constexpr bool is_trivially_destructible = std::is_trivially_destructible_v<E>;

    // construction
public:
    /// Default result holds a default constructed error.
    constexpr result()
        requires std::is_default_constructible_v<E>
      : _error(), _has_value(false)
    {
    }

    constexpr result(T& ref) : _ptr(&ref), _has_value(true) {} // NOLINT

    // no binding to temporaries
    result(T&&) = delete;

    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(as_error_t<G>&& err) // NOLINT
      : _error(rc::move(err.value)), _has_value(false)
    {
    }
    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& err) // NOLINT
      : _error(err.value), _has_value(false)
    {
    }

    /// Allows result<T&, E> -> result<T const&, E>.
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr result(result<U&, E> const& rhs) // NOLINT
      : _has_value(rhs.has_value())
    {
        if (_has_value)
            _ptr = &rhs.value();
        else
            new (rc::placement_new, &_error) E(rhs.error());
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires is_trivially_copyable
    = default;
    result(result const&)
        requires is_trivially_copyable
    = default;
    result& operator=(result&&)
        requires is_trivially_copyable
    = default;
    result& operator=(result const&)
        requires is_trivially_copyable
    = default;

    ~result()
        requires is_trivially_destructible
    = default;

    // non-trivial copy/move/destroy
public:
    result(result&& rhs) noexcept
        requires(!is_trivially_copyable)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            _ptr = rhs._ptr;
        else
            new (rc::placement_new, &_error) E(rc::move(rhs._error));
    }

    result(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            _ptr = rhs._ptr;
        else
            new (rc::placement_new, &_error) E(rhs._error);
    }

    result& operator=(result&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (this == &rhs)
            return *this;

        impl_destroy();
        _has_value = rhs._has_value;
        if (_has_value)
            _ptr = rhs._ptr;
        else
            new (rc::placement_new, &_error) E(rc::move(rhs._error));
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<E>)
    {
        if (this == &rhs)
            return *this;

        impl_destroy();
        _has_value = rhs._has_value;
        if (_has_value)
            _ptr = rhs._ptr;
        else
            new (rc::placement_new, &_error) E(rhs._error);
        return *this;
    }

    ~result()
        requires(!is_trivially_destructible)
    {
        impl_destroy();
    }

    // queries
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    // access
public:
    /// Precondition: has_value()
    [[nodiscard]] constexpr T& value() const
    {
        RC_ASSERT(_has_value, "attempted to access value of result holding an error");
        return *_ptr;
    }

    [[nodiscard]] constexpr E& error() &
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error;
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return rc::move(_error);
    }

    /// Returns the referenced object or the fallback object.
    [[nodiscard]] constexpr T& value_or(T& fallback) const { return _has_value ? *_ptr : fallback; }

    // helper
private:
    void impl_destroy()
    {
        if (!_has_value)
            _error.~E();
    }

    // members
private:
    union
    {
        T* _ptr;
        E _error;
    };
    bool _has_value = false;
};
