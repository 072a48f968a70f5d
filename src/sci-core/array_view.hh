#pragma once

#include <sci-core/assert.hh>
#include <sci-core/blas.hh>
#include <sci-core/cow_array_ref.hh>
#include <sci-core/fwd.hh>
#include <sci-core/strided_ops.hh>
#include <sci-core/strided_span.hh>
#include <sci-core/utility.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

namespace sc
{
/// What an array view needs from the container it aliases.
/// data() is a write access (may fork shared storage), cdata() is a read access (nullptr if uninitialized).
template <class C>
concept container_reference = std::is_copy_constructible_v<C> && requires(C& c, C const& cc) {
    typename C::value_type;
    { c.data() } -> std::same_as<typename C::value_type*>;
    { cc.cdata() } -> std::same_as<typename C::value_type const*>;
    { cc.size() } -> std::convertible_to<isize>;
    { cc.is_initialized() } -> std::convertible_to<bool>;
};

/// Contiguous view over a shared copy-on-write array of T.
template <class T, vector_orientation Orientation = vector_orientation::column>
using array_view = basic_array_view<cow_array_ref<T>, view_layout::contiguous, Orientation>;

/// Strided view over a shared copy-on-write array of T.
template <class T, vector_orientation Orientation = vector_orientation::column>
using strided_array_view = basic_array_view<cow_array_ref<T>, view_layout::strided, Orientation>;

[[nodiscard]] constexpr vector_orientation transposed_orientation(vector_orientation o)
{
    return o == vector_orientation::column ? vector_orientation::row : vector_orientation::column;
}

/// Tag for resize(n, sc::keep_contents): check the length without zeroing the elements.
struct keep_contents_t
{
};
inline constexpr keep_contents_t keep_contents{};

namespace impl
{
// stride member of contiguous views, takes no space
struct unit_stride
{
};

// element type of the other operand in a type promotion: a view or a plain scalar
template <class Other>
struct promotion_element
{
    using type = Other;
};
template <class C, view_layout L, vector_orientation O>
struct promotion_element<basic_array_view<C, L, O>>
{
    using type = typename C::value_type;
};
} // namespace impl
} // namespace sc

/// Window into a shared container: a first index, a size and (for strided views) an element stride.
///
/// Logical element i lives at container index first_index() + i * stride().
/// Contiguous views have a compile-time stride of 1 that is not stored.
///
/// Views have reference semantics. Copying a view, slicing it or assigning it never copies elements; it
/// shares the container, so a write through one view is visible through all views of the same container.
/// The exception is copy-on-write: a write goes through ContainerRef::data(), which forks elements the
/// container shares with other owners (e.g. the owning array the view was made from). From then on all
/// views of this container see the private copy and the other owners keep the old elements.
///
/// Contract violations (bad indices, bad slice ranges, zero stride, operations on an empty view, length
/// mismatches) are fatal assertions, checked before anything is modified.
///
/// Not thread-safe: views sharing a container must not be written concurrently.
template <class ContainerRef, sc::view_layout Layout, sc::vector_orientation Orientation>
struct sc::basic_array_view
{
    static_assert(sc::container_reference<ContainerRef>, "ContainerRef does not satisfy the container reference contract");

    // types
public:
    using container_type = ContainerRef;
    using element_type = typename ContainerRef::value_type;

    static constexpr view_layout layout = Layout;
    static constexpr vector_orientation orientation = Orientation;
    static constexpr bool is_strided = Layout == view_layout::strided;

    /// Result of view(start, end): same layout as this view.
    using view_type = basic_array_view;
    /// Result of view(start, end, stride): always strided.
    using strided_view_type = basic_array_view<ContainerRef, view_layout::strided, Orientation>;

    /// Storage produced by evaluating the transposition of this vector: fresh contiguous elements with the
    /// opposite orientation.
    using transposed = basic_array_view<ContainerRef, view_layout::contiguous, sc::transposed_orientation(Orientation)>;

    /// Storage for results that combine this vector with Other (another view type or a scalar type):
    /// contiguous, this orientation, elements of the common type.
    template <class Other>
    using promote = basic_array_view<
        typename ContainerRef::template rebind<std::common_type_t<element_type, typename impl::promotion_element<Other>::type>>,
        view_layout::contiguous,
        Orientation>;

    // construction
public:
    /// Empty view over an uninitialized container.
    basic_array_view() = default;

    /// Views `size` consecutive elements of `container` starting at `first_index`.
    /// Precondition: the window lies inside the container.
    basic_array_view(ContainerRef const& container, isize first_index, isize size)
        requires(!is_strided)
      : _container(container), _first_index(first_index), _size(size)
    {
        check_window();
    }

    /// Views `size` elements of `container` at first_index, first_index + stride, ...
    /// Precondition: stride > 0 and the window lies inside the container.
    basic_array_view(ContainerRef const& container, isize first_index, isize size, isize stride)
        requires(is_strided)
      : _container(container), _first_index(first_index), _size(size), _stride(stride)
    {
        SC_ASSERT_ARG(stride != 0, "zero stride in view construction");
        SC_ASSERT_ARG(stride > 0, "negative stride in view construction");
        check_window();
    }

    /// Views all elements of `container`.
    explicit basic_array_view(ContainerRef const& container) : _container(container), _size(_container.size()) {}

    /// Builds a fresh container from the arguments and views all of it.
    /// Allows standalone views without a pre-existing owning vector, e.g. array_view<double>(5, 1.0).
    template <class Arg0, class... Args>
        requires(!std::is_same_v<std::remove_cvref_t<Arg0>, ContainerRef> && std::is_constructible_v<ContainerRef, Arg0, Args...>)
    explicit basic_array_view(Arg0&& arg0, Args&&... args)
      : _container(sc::forward<Arg0>(arg0), sc::forward<Args>(args)...), _size(_container.size())
    {
    }

    /// Builds a fresh container holding the listed elements and views all of it.
    basic_array_view(std::initializer_list<element_type> init) : _container(init), _size(_container.size()) {}

    // reference semantics
public:
    basic_array_view(basic_array_view const&) = default;
    basic_array_view(basic_array_view&&) = default;

    /// Adopts the window of rhs and swaps containers with it; no elements are copied.
    basic_array_view& operator=(basic_array_view rhs)
    {
        _first_index = rhs._first_index;
        _size = rhs._size;
        _stride = rhs._stride;
        sc::swap(_container, rhs._container);
        return *this;
    }

    /// Makes this view alias exactly what rhs aliases.
    /// Only meant for proxy objects inside the arithmetic layer; ordinary code should assign.
    void force_ref_sharing(basic_array_view const& rhs) { *this = rhs; }

    // element access
public:
    /// Reads logical element i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] element_type index(isize i) const
    {
        SC_ASSERT_ARG(0 <= i && i < _size, "index(): index out of bounds");
        return _container.cdata()[map_index(i)];
    }

    /// Writes logical element i, or combines it with value (`current op= value`) for Op != assign_op::none.
    /// Writing may fork a shared container.
    /// Precondition: 0 <= i < size().
    template <assign_op Op = assign_op::none>
    void index_assign(isize i, element_type const& value)
    {
        SC_ASSERT_ARG(0 <= i && i < _size, "index_assign(): index out of bounds");
        auto& target = _container.data()[map_index(i)];

        if constexpr (Op == assign_op::none)
            target = value;
        else if constexpr (Op == assign_op::add)
            target += value;
        else if constexpr (Op == assign_op::sub)
            target -= value;
        else if constexpr (Op == assign_op::mul)
            target *= value;
        else if constexpr (Op == assign_op::div)
            target /= value;
        else
            static_assert(Op == assign_op::none, "unsupported assign_op");
    }

    /// Precondition: !empty().
    [[nodiscard]] element_type front() const
    {
        SC_ASSERT_STATE(!empty(), "front() called on empty view");
        return index(0);
    }

    /// Precondition: !empty().
    [[nodiscard]] element_type back() const
    {
        SC_ASSERT_STATE(!empty(), "back() called on empty view");
        return index(_size - 1);
    }

    /// Precondition: !empty().
    void set_front(element_type const& value)
    {
        SC_ASSERT_STATE(!empty(), "set_front() called on empty view");
        index_assign(0, value);
    }

    /// Precondition: !empty().
    void set_back(element_type const& value)
    {
        SC_ASSERT_STATE(!empty(), "set_back() called on empty view");
        index_assign(_size - 1, value);
    }

    // index mapping
public:
    /// Container index of logical element i. Does not check bounds.
    [[nodiscard]] constexpr isize map_index(isize i) const
    {
        if constexpr (is_strided)
            return _first_index + i * _stride;
        else
            return _first_index + i;
    }

    // sub-views
public:
    /// View of the logical range [start, end) with the same layout, sharing the container.
    /// Precondition: 0 <= start <= end <= size().
    [[nodiscard]] view_type view(isize start, isize end) const
    {
        SC_ASSERT_ARG(0 <= start && start <= end && end <= _size, "view(): invalid slice range");

        if constexpr (is_strided)
            return view_type(_container, map_index(start), end - start, _stride);
        else
            return view_type(_container, map_index(start), end - start);
    }

    /// Strided view selecting every new_stride-th element of [start, end), sharing the container.
    /// The size is ceil((end - start) / new_stride); strides compose multiplicatively.
    /// Precondition: new_stride > 0, 0 <= start <= end <= size().
    [[nodiscard]] strided_view_type view(isize start, isize end, isize new_stride) const
    {
        SC_ASSERT_ARG(new_stride != 0, "zero stride in view-of-view construction");
        SC_ASSERT_ARG(new_stride > 0, "negative stride in view-of-view construction");
        SC_ASSERT_ARG(0 <= start && start <= end && end <= _size, "view(): invalid slice range");

        auto const count = sc::int_div_round_up(end - start, new_stride);
        return strided_view_type(_container, map_index(start), count, stride() * new_stride);
    }

    /// Same as view(start, end).
    [[nodiscard]] view_type slice(isize start, isize end) const { return view(start, end); }
    /// Same as view(start, end, new_stride).
    [[nodiscard]] strided_view_type slice(isize start, isize end, isize new_stride) const
    {
        return view(start, end, new_stride);
    }

    // shrinking
public:
    /// Drops the first element from the window. The container is not touched.
    /// Precondition: !empty().
    void pop_front()
    {
        SC_ASSERT_STATE(!empty(), "pop_front() called on empty view");
        _first_index += stride();
        --_size;
    }

    /// Drops the last element from the window. The container is not touched.
    /// Precondition: !empty().
    void pop_back()
    {
        SC_ASSERT_STATE(!empty(), "pop_back() called on empty view");
        --_size;
    }

    // resizing
public:
    /// A view cannot reallocate shared storage, so the only valid "resize" keeps the size.
    /// Sets all elements to zero.
    /// Precondition: new_size == size().
    void resize(isize new_size)
    {
        resize(new_size, sc::keep_contents);
        if (_size > 0)
            blas::scal(_size, element_type(0), data(), stride());
    }

    /// Checks new_size == size() and leaves the elements as they are.
    void resize(isize new_size, keep_contents_t)
    {
        SC_ASSERT_ARG(new_size == _size, "length mismatch in vector operation");
    }

    // bulk numeric operations
public:
    /// this <- alpha * this
    void scale(element_type const& alpha)
    {
        if (_size > 0)
            sc::scale<element_type>(as_strided_span(), alpha);
    }

    /// this <- alpha * x + this
    /// x can be any view type with the same element type.
    /// Precondition: x.size() == size().
    template <class View>
    void scaled_add(element_type const& alpha, View const& x)
    {
        SC_ASSERT_ARG(x.size() == _size, "length mismatch in vector operation");
        if (_size > 0)
            sc::scaled_add<element_type>(alpha, x.as_const_strided_span(), as_strided_span());
    }

    /// Dot product with rhs; with Tr == transpose::yes complex elements of this view are conjugated.
    /// Precondition: rhs.size() == size().
    template <transpose Tr = transpose::no, class View>
    [[nodiscard]] element_type dot(View const& rhs) const
    {
        SC_ASSERT_ARG(rhs.size() == _size, "length mismatch in vector operation");
        return sc::dot<Tr, element_type>(as_const_strided_span(), rhs.as_const_strided_span());
    }

    /// Copies the elements of source into this view, conjugating them for Tr == transpose::yes.
    /// Precondition: source.size() == size().
    template <transpose Tr = transpose::no, class View>
    void copy(View const& source)
    {
        resize(source.size(), sc::keep_contents);
        if (_size > 0)
            sc::strided_copy<Tr, element_type>(source.as_const_strided_span(), as_strided_span());
    }

    // raw access
public:
    /// Mutable pointer to logical element 0; forks a shared container.
    /// nullptr if the container is uninitialized.
    /// An empty view points at most one past the end of the container.
    [[nodiscard]] element_type* data()
    {
        auto const base = _container.data();
        return base ? base + pointer_offset() : nullptr;
    }

    /// Read-only pointer to logical element 0, nullptr if the container is uninitialized.
    [[nodiscard]] element_type const* cdata() const
    {
        if (!_container.is_initialized())
            return nullptr;
        return _container.cdata() + pointer_offset();
    }

    /// The (pointer, size, stride) triple of this view for writing; forks a shared container.
    [[nodiscard]] strided_span<element_type> as_strided_span()
    {
        return strided_span<element_type>(data(), _size, stride());
    }

    /// The (pointer, size, stride) triple of this view for reading.
    [[nodiscard]] strided_span<element_type const> as_const_strided_span() const
    {
        return strided_span<element_type const>(cdata(), _size, stride());
    }

    // queries
public:
    [[nodiscard]] isize first_index() const { return _first_index; }
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Container index difference between consecutive elements (always 1 for contiguous views).
    [[nodiscard]] constexpr isize stride() const
    {
        if constexpr (is_strided)
            return _stride;
        else
            return 1;
    }

    [[nodiscard]] ContainerRef const& container() const { return _container; }

    // helper
private:
    // popping a strided view empty can leave _first_index past the container end
    isize pointer_offset() const
    {
        return empty() ? sc::min(_first_index, isize(_container.size())) : _first_index;
    }

    void check_window() const
    {
        SC_ASSERT_ARG(_first_index >= 0, "view first index must be non-negative");
        SC_ASSERT_ARG(_size >= 0, "view size must be non-negative");
        SC_ASSERT_ARG(_size == 0 || map_index(_size - 1) < isize(_container.size()), "view exceeds its container");
    }

    using stride_storage = std::conditional_t<is_strided, isize, impl::unit_stride>;

    static constexpr stride_storage default_stride()
    {
        if constexpr (is_strided)
            return 1;
        else
            return {};
    }

    // members
private:
    ContainerRef _container;
    isize _first_index = 0;
    isize _size = 0;
    [[no_unique_address]] stride_storage _stride = default_stride();
};
