#pragma once

#include <source_location>

namespace sc
{
/// Type alias for std::source_location
/// Captured by every failed contract check to report file, line and function
using source_location = std::source_location;
} // namespace sc
