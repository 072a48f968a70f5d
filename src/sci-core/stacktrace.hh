#pragma once

#include <version>

// std::stacktrace is optional in some standard libraries (e.g. libstdc++ built without backtrace support)
#ifdef __cpp_lib_stacktrace

#include <stacktrace>

#define SC_HAS_STACKTRACE

namespace sc
{
/// Type alias for std::stacktrace
/// Printed by the default assertion handler
using stacktrace = std::stacktrace;
} // namespace sc

#endif
