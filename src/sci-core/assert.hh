#pragma once

// Lean header with minimal dependencies, included by every view and container header.
#include <sci-core/macros.hh>
#include <sci-core/source_location.hh>

// =========================================================================================================
// SC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   SC_ASSERT is enabled in SC_DEBUG and SC_RELWITHDEBINFO builds.
//   In SC_RELEASE builds, it is disabled unless SC_ENABLE_ASSERT_IN_RELEASE is defined.
//   SC_ASSERT_ALWAYS, SC_ASSERT_ARG and SC_ASSERT_STATE are active in every build.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   They catch PROGRAMMER ERRORS: a bad slice range or a pop on an empty view is a bug in the caller.
//
// What assertions are NOT for:
//   - NOT for user input validation
//   - NOT for common/expected error conditions
//
// Usage:
//   SC_ASSERT(ptr != nullptr, "pointer must not be null");
//   SC_ASSERT(idx < size, "index out of bounds");
//
#define SC_ASSERT(cond, msg) SC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// SC_ASSERT_ALWAYS - Always-active assertion
//
// Like SC_ASSERT but remains active in all build configurations, including release builds.
//
#define SC_ASSERT_ALWAYS(cond, msg) SC_IMPL_ASSERT_KIND(::sc::impl::assertion_kind::invariant, cond, msg)

// =========================================================================================================
// SC_ASSERT_ARG / SC_ASSERT_STATE - Always-active contract checks
//
// Same failure path as SC_ASSERT_ALWAYS, but the failure is tagged so handlers (and tests) can tell
// a call with invalid arguments apart from a call on an object in the wrong state.
//
// Usage:
//   SC_ASSERT_ARG(0 <= start && start <= end && end <= size(), "view(): invalid slice range");
//   SC_ASSERT_STATE(!empty(), "pop_front() called on empty view");
//
#define SC_ASSERT_ARG(cond, msg) SC_IMPL_ASSERT_KIND(::sc::impl::assertion_kind::invalid_argument, cond, msg)
#define SC_ASSERT_STATE(cond, msg) SC_IMPL_ASSERT_KIND(::sc::impl::assertion_kind::invalid_state, cond, msg)

// =========================================================================================================
// SC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define SC_DEBUG_BREAK() SC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// SC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define SC_BREAK_AND_ABORT() (SC_DEBUG_BREAK(), ::sc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace sc::impl
{
/// Category of a failed check
enum class assertion_kind
{
    invariant,        // internal invariant or generic precondition
    invalid_argument, // caller passed arguments outside the contract
    invalid_state,    // operation not allowed in the current state (e.g. empty view)
};

// Called when an assertion fails
// Dispatches to the active assertion handler (or prints to stderr)
// Note: does not abort, caller must follow with SC_BREAK_AND_ABORT()
SC_COLD_FUNC void handle_assert_failure(assertion_kind kind,
                                        char const* expression,
                                        char const* message,
                                        sc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace sc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef SC_COMPILER_MSVC

#define SC_IMPL_DEBUG_BREAK() (::sc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SC_COMPILER_POSIX)

// SIGTRAP (5) signals a breakpoint to an attached debugger
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define SC_IMPL_DEBUG_BREAK() (::sc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SC_IMPL_DEBUG_BREAK() void(0)

#endif

#define SC_IMPL_ASSERT_KIND(kind, cond, msg)                                                         \
    do                                                                                               \
    {                                                                                                \
        if (!(cond)) [[unlikely]]                                                                    \
        {                                                                                            \
            ::sc::impl::handle_assert_failure(kind, #cond, msg, ::sc::source_location::current()); \
            SC_BREAK_AND_ABORT();                                                                    \
        }                                                                                            \
    } while (false)

#if SC_ASSERT_ENABLED

#define SC_IMPL_ASSERT(cond, msg) SC_IMPL_ASSERT_KIND(::sc::impl::assertion_kind::invariant, cond, msg)

#else

// Stripped, but the condition and message still have to compile
#define SC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SC_UNUSED(cond);          \
        SC_UNUSED(msg);           \
    } while (false)

#endif
