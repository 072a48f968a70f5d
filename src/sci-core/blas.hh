#pragma once

#include <sci-core/assert.hh>
#include <sci-core/fwd.hh>

#include <complex>
#include <concepts>
#include <type_traits>

// =========================================================================================================
// Bulk numeric backend: BLAS level-1 subset on raw (pointer, count, increment) triples
// =========================================================================================================
//
//   scal(n, alpha, x, incx)             x <- alpha * x
//   axpy(n, alpha, x, incx, y, incy)    y <- alpha * x + y
//   copy(n, x, incx, y, incy)           y <- x
//   dot<tr>(n, x, incx, y, incy)        sum of x_i * y_i (x conjugated for tr == transpose::yes)
//   conjugate(n, x, incx)               x <- conj(x), no-op for real types
//
// float, double, std::complex<float> and std::complex<double> go through CBLAS (see blas.cc).
// Other arithmetic element types (e.g. integers) have no BLAS kernels and run the same strided loop here.
//
// All routines require n >= 0 and positive increments.
// Element i of x lives at x[i * incx]; nothing here checks that those addresses are valid.

namespace sc::blas
{
template <class T>
struct is_complex : std::false_type
{
};
template <class T>
struct is_complex<std::complex<T>> : std::true_type
{
};
template <class T>
constexpr bool is_complex_v = is_complex<T>::value;

/// Element types with native BLAS kernels.
template <class T>
concept blas_scalar = std::same_as<T, float> || std::same_as<T, double> || std::same_as<T, std::complex<float>>
                   || std::same_as<T, std::complex<double>>;

/// Element types served by the generic strided loops.
template <class T>
concept loop_scalar = !blas_scalar<T> && requires(T a, T b) {
    a = a * b;
    a = a + b;
    T(0);
};

// BLAS-backed kernels
void scal(isize n, float alpha, float* x, isize incx);
void scal(isize n, double alpha, double* x, isize incx);
void scal(isize n, std::complex<float> alpha, std::complex<float>* x, isize incx);
void scal(isize n, std::complex<double> alpha, std::complex<double>* x, isize incx);

void axpy(isize n, float alpha, float const* x, isize incx, float* y, isize incy);
void axpy(isize n, double alpha, double const* x, isize incx, double* y, isize incy);
void axpy(isize n, std::complex<float> alpha, std::complex<float> const* x, isize incx, std::complex<float>* y, isize incy);
void axpy(isize n, std::complex<double> alpha, std::complex<double> const* x, isize incx, std::complex<double>* y, isize incy);

void copy(isize n, float const* x, isize incx, float* y, isize incy);
void copy(isize n, double const* x, isize incx, double* y, isize incy);
void copy(isize n, std::complex<float> const* x, isize incx, std::complex<float>* y, isize incy);
void copy(isize n, std::complex<double> const* x, isize incx, std::complex<double>* y, isize incy);

// unconjugated dot product
[[nodiscard]] float dotu(isize n, float const* x, isize incx, float const* y, isize incy);
[[nodiscard]] double dotu(isize n, double const* x, isize incx, double const* y, isize incy);
[[nodiscard]] std::complex<float> dotu(isize n, std::complex<float> const* x, isize incx, std::complex<float> const* y, isize incy);
[[nodiscard]] std::complex<double> dotu(isize n, std::complex<double> const* x, isize incx, std::complex<double> const* y, isize incy);

// conjugated dot product, conj(x) . y
[[nodiscard]] std::complex<float> dotc(isize n, std::complex<float> const* x, isize incx, std::complex<float> const* y, isize incy);
[[nodiscard]] std::complex<double> dotc(isize n, std::complex<double> const* x, isize incx, std::complex<double> const* y, isize incy);

// conjugation in place through the real scal on the imaginary parts
void conjugate(isize n, std::complex<float>* x, isize incx);
void conjugate(isize n, std::complex<double>* x, isize incx);

// generic strided loops
template <loop_scalar T>
void scal(isize n, T alpha, T* x, isize incx)
{
    SC_ASSERT(n >= 0 && incx > 0, "scal: invalid count or increment");
    for (isize i = 0; i < n; ++i)
        x[i * incx] = alpha * x[i * incx];
}

template <loop_scalar T>
void axpy(isize n, T alpha, T const* x, isize incx, T* y, isize incy)
{
    SC_ASSERT(n >= 0 && incx > 0 && incy > 0, "axpy: invalid count or increment");
    for (isize i = 0; i < n; ++i)
        y[i * incy] = alpha * x[i * incx] + y[i * incy];
}

template <loop_scalar T>
void copy(isize n, T const* x, isize incx, T* y, isize incy)
{
    SC_ASSERT(n >= 0 && incx > 0 && incy > 0, "copy: invalid count or increment");
    for (isize i = 0; i < n; ++i)
        y[i * incy] = x[i * incx];
}

template <loop_scalar T>
[[nodiscard]] T dotu(isize n, T const* x, isize incx, T const* y, isize incy)
{
    SC_ASSERT(n >= 0 && incx > 0 && incy > 0, "dot: invalid count or increment");
    T sum = T(0);
    for (isize i = 0; i < n; ++i)
        sum = sum + x[i * incx] * y[i * incy];
    return sum;
}

/// Dot product, conjugating x for complex elements when Tr == transpose::yes.
template <sc::transpose Tr, class T>
[[nodiscard]] T dot(isize n, T const* x, isize incx, T const* y, isize incy)
{
    if constexpr (Tr == sc::transpose::yes && is_complex_v<T>)
        return dotc(n, x, incx, y, incy);
    else
        return dotu(n, x, incx, y, incy);
}

/// Conjugates complex elements in place; real and integer elements are left untouched.
template <class T>
    requires(!is_complex_v<T>)
void conjugate(isize n, T* x, isize incx)
{
    SC_UNUSED(x);
    SC_ASSERT(n >= 0 && incx > 0, "conjugate: invalid count or increment");
}
} // namespace sc::blas
