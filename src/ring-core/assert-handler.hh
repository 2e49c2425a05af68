#pragma once

#include <ring-core/source_location.hh>

#include <functional>
#include <string>

// Failed RC_ASSERT / RC_ASSERT_ALWAYS checks are routed through a stack of handlers.
// The innermost handler sees the failure; with an empty stack it is printed to stderr.
// A handler that returns lets the process abort. A handler that throws unwinds out of the failed
// ring-core call instead, which is how the tests observe assertions:
//
//   {
//       auto guard = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const& info) {
//           throw my_assertion_exception{info.message};
//       });
//       for (auto& v : queue)
//           queue.push(v); // throws my_assertion_exception on the next iterator step
//   }
//
// The stack is process-wide and unsynchronized.

namespace rc::impl
{
struct assertion_info
{
    /// the asserted condition as written
    std::string expression;
    std::string message;
    rc::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// Installs `handler` for the lifetime of this object.
/// Guards must be destroyed in reverse order of creation, which scoping does automatically.
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};

/// number of handlers currently installed
[[nodiscard]] int assertion_handler_depth();
} // namespace rc::impl
