#include "assert.hh"

#include <sci-core/assert-handler.hh>
#include <sci-core/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef SC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
using handler_fn = std::move_only_function<void(sc::impl::assertion_info const&)>;

// NOTE: global and unsynchronized, like the rest of the library
std::vector<handler_fn>& assertion_handlers()
{
    static std::vector<handler_fn> handlers;
    return handlers;
}

void print_assertion(sc::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << loc.file_name() << ':' << loc.line() << ": " << sc::impl::to_string(info.kind)
              << " in " << loc.function_name() << '\n';
    std::cerr << "  check:   " << info.expression << '\n';
    std::cerr << "  message: " << info.message << '\n';

#ifdef SC_HAS_STACKTRACE
    std::cerr << sc::stacktrace::current() << '\n';
#endif
}

#ifdef SC_OS_LINUX
// a traced process has a non-zero "TracerPid:" line in /proc/self/status
bool has_tracer()
{
    auto const f = std::fopen("/proc/self/status", "r");
    if (!f)
        return false;

    int tracer = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), f))
        if (std::sscanf(line, "TracerPid: %d", &tracer) == 1)
            break;

    std::fclose(f);
    return tracer != 0;
}
#endif
} // namespace

void sc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    assertion_handlers().push_back(std::move(handler));
}

void sc::impl::pop_assertion_handler()
{
    auto& handlers = assertion_handlers();
    SC_ASSERT(!handlers.empty(), "more assertion handlers popped than pushed");
    if (!handlers.empty())
        handlers.pop_back();
}

sc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

sc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

char const* sc::impl::to_string(assertion_kind kind)
{
    switch (kind)
    {
    case assertion_kind::invariant:
        return "invariant";
    case assertion_kind::invalid_argument:
        return "invalid argument";
    case assertion_kind::invalid_state:
        return "invalid state";
    }
    return "unknown";
}

SC_COLD_FUNC void sc::impl::handle_assert_failure(assertion_kind kind,
                                                  char const* expression,
                                                  char const* message,
                                                  sc::source_location location)
{
    auto const info = assertion_info{
        .kind = kind,
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = assertion_handlers();
    if (handlers.empty())
        print_assertion(info);
    else
        handlers.back()(info); // may throw to unwind out of the failed check

    // the caller aborts
}

bool sc::impl::is_debugger_connected() noexcept
{
#if defined(SC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(SC_OS_LINUX)
    return has_tracer();
#else
    return false;
#endif
}

[[noreturn]] void sc::impl::perform_abort() noexcept
{
    std::abort();
}
