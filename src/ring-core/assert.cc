#include "assert.hh"

#include <ring-core/assert-handler.hh>

#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>
#include <version>

#ifdef __cpp_lib_stacktrace
#include <stacktrace>
#endif

namespace
{
std::vector<rc::impl::assertion_handler>& handler_stack()
{
    // function-local so assertions during static initialization of other TUs are safe
    static std::vector<rc::impl::assertion_handler> stack;
    return stack;
}

void print_to_stderr(rc::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << loc.file_name() << '(' << loc.line() << "): ring-core assertion `" << info.expression
              << "` failed: " << info.message << "\n  in " << loc.function_name() << '\n';

#ifdef __cpp_lib_stacktrace
    std::cerr << std::stacktrace::current(2) << '\n';
#endif
}
} // namespace

rc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

rc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    handler_stack().pop_back();
}

int rc::impl::assertion_handler_depth()
{
    return int(handler_stack().size());
}

void rc::impl::assertion_failed(char const* expression, char const* message, rc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& stack = handler_stack();
    if (stack.empty())
        print_to_stderr(info);
    else
        stack.back()(info); // may throw

    std::abort();
}
