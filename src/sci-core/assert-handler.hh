#pragma once

#include <sci-core/assert.hh>
#include <sci-core/source_location.hh>

#include <functional>
#include <string>

namespace sc::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = sc::impl::scoped_assertion_handler([](sc::impl::assertion_info const& info) {
//           log_contract_failure(info);
//           throw contract_failure{info.kind, info.message};
//       });
//
//       // Any failed contract in this scope will use the custom handler
//       view.pop_front();
//   } // handler is automatically popped here

struct assertion_info
{
    assertion_kind kind = assertion_kind::invariant;
    std::string expression;
    std::string message;
    sc::source_location location;
};

// Push a custom assertion handler onto the handler stack
// The handler will be called for all assertion failures until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// NOTE: prefer scoped_assertion_handler, it pops even when a handler throws
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};

// Human-readable name of an assertion kind ("invalid argument", ...)
char const* to_string(assertion_kind kind);
} // namespace sc::impl
