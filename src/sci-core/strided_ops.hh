#pragma once

#include <sci-core/assert.hh>
#include <sci-core/blas.hh>
#include <sci-core/fwd.hh>
#include <sci-core/strided_span.hh>

#include <type_traits>

// Scaling, scaled addition, dot product and copy on strided element ranges.
// Every storage kind that can describe itself as a strided_span shares these, instead of looping per
// storage type: the (pointer, size, stride) triple goes straight to the BLAS backend.

namespace sc
{
/// x <- alpha * x
template <class T>
void scale(strided_span<T> x, std::type_identity_t<T> const& alpha)
{
    blas::scal(x.size(), alpha, x.start_ptr(), x.stride());
}

/// y <- alpha * x + y
/// Precondition: x.size() == y.size()
template <class T>
void scaled_add(std::type_identity_t<T> const& alpha, strided_span<std::type_identity_t<T> const> x, strided_span<T> y)
{
    SC_ASSERT_ARG(x.size() == y.size(), "length mismatch in vector operation");
    blas::axpy(y.size(), alpha, x.start_ptr(), x.stride(), y.start_ptr(), y.stride());
}

/// Sum of x_i * y_i; with Tr == transpose::yes, complex x is conjugated.
/// Precondition: x.size() == y.size()
template <transpose Tr = transpose::no, class T>
[[nodiscard]] T dot(strided_span<T const> x, strided_span<std::type_identity_t<T> const> y)
{
    SC_ASSERT_ARG(x.size() == y.size(), "length mismatch in vector operation");
    return blas::dot<Tr>(x.size(), x.start_ptr(), x.stride(), y.start_ptr(), y.stride());
}

/// dest <- source, or the conjugate of source for Tr == transpose::yes.
/// Source and destination may have different strides but must have equal sizes.
template <transpose Tr = transpose::no, class T>
void strided_copy(strided_span<std::type_identity_t<T> const> source, strided_span<T> dest)
{
    SC_ASSERT_ARG(source.size() == dest.size(), "length mismatch in vector operation");
    blas::copy(dest.size(), source.start_ptr(), source.stride(), dest.start_ptr(), dest.stride());
    if constexpr (Tr == transpose::yes)
        blas::conjugate(dest.size(), dest.start_ptr(), dest.stride());
}
} // namespace sc
