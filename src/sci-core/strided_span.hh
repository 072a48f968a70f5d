#pragma once

#include <sci-core/assert.hh>
#include <sci-core/fwd.hh>

#include <compare>
#include <type_traits>

/// Random access iterator over elements separated by a constant element stride.
///
/// The stride counts elements, not bytes: stride 1 is contiguous, stride 2 visits every other element.
/// This matches the "increment" argument of BLAS routines, so a (pointer, size, stride) triple can be
/// handed to the numeric backend unchanged.
template <class T>
struct sc::strided_iterator
{
    using difference_type = isize;
    using value_type = std::remove_const_t<T>;

    constexpr strided_iterator() = default;
    constexpr strided_iterator(T* ptr, isize stride) : _ptr(ptr), _stride(stride) {}

    [[nodiscard]] constexpr T& operator*() const { return *_ptr; }
    [[nodiscard]] constexpr T* operator->() const { return _ptr; }
    [[nodiscard]] constexpr T& operator[](isize n) const { return _ptr[n * _stride]; }

    constexpr strided_iterator& operator++()
    {
        _ptr += _stride;
        return *this;
    }
    constexpr strided_iterator operator++(int)
    {
        auto const tmp = *this;
        ++(*this);
        return tmp;
    }

    constexpr strided_iterator& operator--()
    {
        _ptr -= _stride;
        return *this;
    }
    constexpr strided_iterator operator--(int)
    {
        auto const tmp = *this;
        --(*this);
        return tmp;
    }

    constexpr strided_iterator& operator+=(isize n)
    {
        _ptr += n * _stride;
        return *this;
    }
    constexpr strided_iterator& operator-=(isize n)
    {
        _ptr -= n * _stride;
        return *this;
    }

    [[nodiscard]] friend constexpr strided_iterator operator+(strided_iterator it, isize n) { return it += n; }
    [[nodiscard]] friend constexpr strided_iterator operator+(isize n, strided_iterator it) { return it += n; }
    [[nodiscard]] friend constexpr strided_iterator operator-(strided_iterator it, isize n) { return it -= n; }

    [[nodiscard]] friend constexpr isize operator-(strided_iterator const& lhs, strided_iterator const& rhs)
    {
        SC_ASSERT(lhs._stride == rhs._stride, "cannot compute distance between iterators with different strides");
        return (lhs._ptr - rhs._ptr) / lhs._stride;
    }

    [[nodiscard]] friend constexpr bool operator==(strided_iterator const& lhs, strided_iterator const& rhs)
    {
        return lhs._ptr == rhs._ptr;
    }
    [[nodiscard]] friend constexpr auto operator<=>(strided_iterator const& lhs, strided_iterator const& rhs)
    {
        return lhs._ptr <=> rhs._ptr;
    }

private:
    T* _ptr = nullptr;
    isize _stride = 1;
};

/// Non-owning view over elements of type T with a constant, positive element stride.
///
/// This is the raw (pointer, size, stride) triple that array views hand to the bulk numeric routines.
/// The elements are not necessarily contiguous, so it provides start_ptr() instead of data() and has
/// an is_contiguous() query.
/// Trivially copyable regardless of T's triviality.
template <class T>
struct sc::strided_span
{
    // construction
public:
    /// Default strided_span is empty: start_ptr() == nullptr, size() == 0, stride() == 1.
    constexpr strided_span() = default;

    // keep triviality
    constexpr strided_span(strided_span const&) = default;
    constexpr strided_span(strided_span&&) = default;
    constexpr strided_span& operator=(strided_span const&) = default;
    constexpr strided_span& operator=(strided_span&&) = default;
    constexpr ~strided_span() = default;

    /// Creates a strided_span viewing ptr[0], ptr[stride], ..., ptr[(size - 1) * stride].
    /// Precondition: size >= 0, stride > 0.
    constexpr explicit strided_span(T* ptr, isize size, isize stride) // NOLINT(bugprone-easily-swappable-parameters)
      : _start(ptr), _size(size), _stride(stride)
    {
        SC_ASSERT(size >= 0, "strided_span size must be non-negative");
        SC_ASSERT(stride > 0, "strided_span stride must be positive");
    }

    /// Converts a mutable strided_span into a read-only one.
    template <class U>
        requires(std::is_same_v<T, U const>)
    constexpr strided_span(strided_span<U> const& s) : _start(s.start_ptr()), _size(s.size()), _stride(s.stride())
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        SC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _start[i * _stride];
    }

    /// Returns a reference to the first element.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        SC_ASSERT(_size > 0, "front() called on empty strided_span");
        return _start[0];
    }

    /// Returns a reference to the last element.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        SC_ASSERT(_size > 0, "back() called on empty strided_span");
        return _start[(_size - 1) * _stride];
    }

    /// Returns a pointer to the first element.
    /// Note: Unlike span::data(), this does not guarantee contiguous storage.
    [[nodiscard]] constexpr T* start_ptr() const { return _start; }

    // iterators
public:
    using iterator = sc::strided_iterator<T>;

    [[nodiscard]] constexpr iterator begin() const { return iterator(_start, _stride); }
    [[nodiscard]] constexpr iterator end() const { return iterator(_start + _size * _stride, _stride); }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }
    /// Returns the element stride between consecutive elements (BLAS increment).
    [[nodiscard]] constexpr isize stride() const { return _stride; }
    /// Size 0 or 1 spans are always considered contiguous.
    [[nodiscard]] constexpr bool is_contiguous() const { return _size <= 1 || _stride == 1; }

    // members
private:
    T* _start = nullptr;
    isize _size = 0;
    isize _stride = 1;
};
