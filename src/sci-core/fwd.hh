#pragma once

#include <cstddef>
#include <cstdint>


namespace sc
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout,
// and plain "int" for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, offsets and strides are signed i64 throughout:
// * view arithmetic subtracts offsets all the time ("end - start", "size - 1")
//   and unsigned types silently wrap on underflow
// * contract checks like "0 <= start <= end" stay meaningful for bad input
// * BLAS increments are signed as well, so strides pass through without casts
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct strided_span;
template <class T>
struct strided_iterator;

//
// Container
//

template <class T>
struct cow_array;
template <class T>
struct cow_array_ref;

//
// Array views
//

/// Memory layout of an array view: consecutive elements or a constant element stride.
enum class view_layout
{
    contiguous,
    strided,
};

/// Orientation of a vector, relevant for the surrounding matrix arithmetic.
enum class vector_orientation
{
    column,
    row,
};

/// Whether an operand is used as-is or logically transposed (conjugated for complex elements).
enum class transpose
{
    no,
    yes,
};

/// Operator applied by compound element assignment ("current op= value").
enum class assign_op
{
    none, // plain overwrite
    add,
    sub,
    mul,
    div,
};

template <class ContainerRef, view_layout Layout, vector_orientation Orientation>
struct basic_array_view;

} // namespace sc
