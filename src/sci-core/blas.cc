#include "blas.hh"

#include <cblas.h>

#include <limits>

namespace
{
// BLAS takes 32-bit counts and increments (unless built with a 64-bit interface)
int to_blas_int(sc::isize v)
{
    SC_ASSERT_ARG(v >= 0 && v <= std::numeric_limits<int>::max(), "count or increment exceeds the BLAS index range");
    return static_cast<int>(v);
}

void check_args(sc::isize n, sc::isize incx)
{
    SC_ASSERT_ARG(n >= 0, "BLAS count must be non-negative");
    SC_ASSERT_ARG(incx > 0, "BLAS increment must be positive");
}

void check_args(sc::isize n, sc::isize incx, sc::isize incy)
{
    check_args(n, incx);
    SC_ASSERT_ARG(incy > 0, "BLAS increment must be positive");
}
} // namespace

//
// scal
//

void sc::blas::scal(isize n, float alpha, float* x, isize incx)
{
    check_args(n, incx);
    cblas_sscal(to_blas_int(n), alpha, x, to_blas_int(incx));
}

void sc::blas::scal(isize n, double alpha, double* x, isize incx)
{
    check_args(n, incx);
    cblas_dscal(to_blas_int(n), alpha, x, to_blas_int(incx));
}

void sc::blas::scal(isize n, std::complex<float> alpha, std::complex<float>* x, isize incx)
{
    check_args(n, incx);
    cblas_cscal(to_blas_int(n), &alpha, x, to_blas_int(incx));
}

void sc::blas::scal(isize n, std::complex<double> alpha, std::complex<double>* x, isize incx)
{
    check_args(n, incx);
    cblas_zscal(to_blas_int(n), &alpha, x, to_blas_int(incx));
}

//
// axpy
//

void sc::blas::axpy(isize n, float alpha, float const* x, isize incx, float* y, isize incy)
{
    check_args(n, incx, incy);
    cblas_saxpy(to_blas_int(n), alpha, x, to_blas_int(incx), y, to_blas_int(incy));
}

void sc::blas::axpy(isize n, double alpha, double const* x, isize incx, double* y, isize incy)
{
    check_args(n, incx, incy);
    cblas_daxpy(to_blas_int(n), alpha, x, to_blas_int(incx), y, to_blas_int(incy));
}

void sc::blas::axpy(isize n, std::complex<float> alpha, std::complex<float> const* x, isize incx, std::complex<float>* y, isize incy)
{
    check_args(n, incx, incy);
    cblas_caxpy(to_blas_int(n), &alpha, x, to_blas_int(incx), y, to_blas_int(incy));
}

void sc::blas::axpy(isize n, std::complex<double> alpha, std::complex<double> const* x, isize incx, std::complex<double>* y, isize incy)
{
    check_args(n, incx, incy);
    cblas_zaxpy(to_blas_int(n), &alpha, x, to_blas_int(incx), y, to_blas_int(incy));
}

//
// copy
//

void sc::blas::copy(isize n, float const* x, isize incx, float* y, isize incy)
{
    check_args(n, incx, incy);
    cblas_scopy(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy));
}

void sc::blas::copy(isize n, double const* x, isize incx, double* y, isize incy)
{
    check_args(n, incx, incy);
    cblas_dcopy(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy));
}

void sc::blas::copy(isize n, std::complex<float> const* x, isize incx, std::complex<float>* y, isize incy)
{
    check_args(n, incx, incy);
    cblas_ccopy(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy));
}

void sc::blas::copy(isize n, std::complex<double> const* x, isize incx, std::complex<double>* y, isize incy)
{
    check_args(n, incx, incy);
    cblas_zcopy(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy));
}

//
// dot
//

float sc::blas::dotu(isize n, float const* x, isize incx, float const* y, isize incy)
{
    check_args(n, incx, incy);
    return cblas_sdot(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy));
}

double sc::blas::dotu(isize n, double const* x, isize incx, double const* y, isize incy)
{
    check_args(n, incx, incy);
    return cblas_ddot(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy));
}

std::complex<float> sc::blas::dotu(isize n, std::complex<float> const* x, isize incx, std::complex<float> const* y, isize incy)
{
    check_args(n, incx, incy);
    std::complex<float> result;
    cblas_cdotu_sub(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy), &result);
    return result;
}

std::complex<double> sc::blas::dotu(isize n, std::complex<double> const* x, isize incx, std::complex<double> const* y, isize incy)
{
    check_args(n, incx, incy);
    std::complex<double> result;
    cblas_zdotu_sub(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy), &result);
    return result;
}

std::complex<float> sc::blas::dotc(isize n, std::complex<float> const* x, isize incx, std::complex<float> const* y, isize incy)
{
    check_args(n, incx, incy);
    std::complex<float> result;
    cblas_cdotc_sub(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy), &result);
    return result;
}

std::complex<double> sc::blas::dotc(isize n, std::complex<double> const* x, isize incx, std::complex<double> const* y, isize incy)
{
    check_args(n, incx, incy);
    std::complex<double> result;
    cblas_zdotc_sub(to_blas_int(n), x, to_blas_int(incx), y, to_blas_int(incy), &result);
    return result;
}

//
// conjugate
//

// std::complex<T> is layout-compatible with T[2], so the imaginary parts form a real vector
// starting at offset 1 with twice the complex increment

void sc::blas::conjugate(isize n, std::complex<float>* x, isize incx)
{
    check_args(n, incx);
    if (n == 0)
        return;
    cblas_sscal(to_blas_int(n), -1.0f, reinterpret_cast<float*>(x) + 1, to_blas_int(2 * incx)); // NOLINT
}

void sc::blas::conjugate(isize n, std::complex<double>* x, isize incx)
{
    check_args(n, incx);
    if (n == 0)
        return;
    cblas_dscal(to_blas_int(n), -1.0, reinterpret_cast<double*>(x) + 1, to_blas_int(2 * incx)); // NOLINT
}
