#pragma once

#include <sci-core/assert.hh>
#include <sci-core/fwd.hh>
#include <sci-core/impl/object_lifetime_util.hh>
#include <sci-core/strided_span.hh>
#include <sci-core/utility.hh>

#include <initializer_list>
#include <new>
#include <type_traits>

/// Reference-counted, copy-on-write array of T.
///
/// A cow_array is a handle to a heap block holding a share count, the element count and the elements.
/// Copying a handle shares the block; the last handle to go away destroys the elements and frees it.
/// Reading never copies. Writing requires a private block: data() calls ensure_unique(), which forks
/// (deep-copies) the block if other handles still share it. After the fork, this handle owns the copy
/// and every other handle keeps the old buffer unchanged.
///
/// A default-constructed cow_array owns no block and reports is_initialized() == false.
///
/// The share count is a plain integer: handles to one block must not be used from multiple threads
/// without external synchronization.
template <class T>
struct sc::cow_array
{
    static_assert(!std::is_reference_v<T>, "cow_array elements cannot be references");
    static_assert(!std::is_const_v<T>, "cow_array elements must be mutable");

    using value_type = T;

    /// Same container family with another element type (used for type promotion).
    template <class U>
    using rebind = cow_array<U>;

    // construction
public:
    /// Uninitialized handle: no block, size() == 0, cdata() == nullptr.
    cow_array() = default;

    /// Creates `size` value-initialized elements (zero for arithmetic types).
    explicit cow_array(isize size) : _block(create_block(size, [&](T*& end) { impl::default_create_objects_to(end, size); }))
    {
    }

    /// Creates `size` copies of `value`.
    cow_array(isize size, T const& value)
      : _block(create_block(size, [&](T*& end) { impl::fill_create_objects_to(end, size, value); }))
    {
    }

    /// Creates an array holding a copy of the listed elements.
    cow_array(std::initializer_list<T> init)
      : _block(create_block(static_cast<isize>(init.size()),
                            [&](T*& end) { impl::copy_create_objects_to(end, init.begin(), init.end()); }))
    {
    }

    // factories
public:
    [[nodiscard]] static cow_array create_defaulted(isize size) { return cow_array(size); }

    [[nodiscard]] static cow_array create_filled(isize size, T const& value) { return cow_array(size, value); }

    /// Deep copy of the viewed elements into a fresh, unshared block.
    /// The result is contiguous even if the source is strided.
    [[nodiscard]] static cow_array create_copy_of(sc::strided_span<T const> source)
    {
        auto const start = source.start_ptr();
        cow_array result;
        result._block = create_block(source.size(),
                                     [&](T*& end)
                                     {
                                         if (source.is_contiguous())
                                             impl::copy_create_objects_to(end, start, start + source.size());
                                         else
                                             impl::copy_create_strided_objects_to(end, start, source.size(), source.stride());
                                     });
        return result;
    }

    // sharing semantics
public:
    /// Shares the block of rhs.
    cow_array(cow_array const& rhs) : _block(rhs._block)
    {
        if (_block)
            ++_block->ref_count;
    }

    cow_array(cow_array&& rhs) noexcept : _block(sc::exchange(rhs._block, nullptr)) {}

    cow_array& operator=(cow_array const& rhs)
    {
        // copy-and-swap keeps self-assignment and aliasing blocks correct
        cow_array tmp(rhs);
        swap_blocks(*this, tmp);
        return *this;
    }

    cow_array& operator=(cow_array&& rhs) noexcept
    {
        cow_array tmp(sc::move(rhs));
        swap_blocks(*this, tmp);
        return *this;
    }

    ~cow_array() { release(_block); }

    // element access
public:
    /// Read access to element i; never forks.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T const& operator[](isize i) const
    {
        SC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return elements_of(_block)[i];
    }

    /// Read-only pointer to the elements, nullptr if uninitialized.
    [[nodiscard]] T const* cdata() const { return _block ? elements_of(_block) : nullptr; }

    /// Mutable pointer to the elements, nullptr if uninitialized.
    /// Requesting it announces a write: a shared block is forked first.
    [[nodiscard]] T* data()
    {
        ensure_unique();
        return _block ? elements_of(_block) : nullptr;
    }

    // copy-on-write
public:
    /// Forks the block if it is shared with other handles, so this handle can be written through.
    /// No-op for unshared or uninitialized handles.
    void ensure_unique()
    {
        if (is_shared())
            fork();
    }

    /// Replaces the block of this handle by a private deep copy, even if it is not shared.
    /// Other handles keep the previous block.
    void fork()
    {
        if (!_block)
            return;

        auto const source = elements_of(_block);
        auto const count = _block->size;
        auto copy = create_block(count, [&](T*& end) { impl::copy_create_objects_to(end, source, source + count); });
        release(sc::exchange(_block, copy));
    }

    // queries
public:
    [[nodiscard]] bool is_initialized() const { return _block != nullptr; }
    [[nodiscard]] isize size() const { return _block ? _block->size : 0; }
    [[nodiscard]] bool empty() const { return size() == 0; }
    /// Number of handles sharing the block (0 if uninitialized).
    [[nodiscard]] isize ref_count() const { return _block ? _block->ref_count : 0; }
    [[nodiscard]] bool is_shared() const { return _block && _block->ref_count > 1; }
    /// True if both handles refer to the same block.
    [[nodiscard]] bool shares_block_with(cow_array const& rhs) const { return _block != nullptr && _block == rhs._block; }

    // block management
private:
    static void swap_blocks(cow_array& a, cow_array& b) noexcept
    {
        auto const tmp = a._block;
        a._block = b._block;
        b._block = tmp;
    }

    struct block_header
    {
        isize ref_count = 1;
        isize size = 0;
    };

    static constexpr isize block_alignment = alignof(block_header) > alignof(T) ? alignof(block_header) : alignof(T);
    // elements start at the first T-aligned offset after the header
    static constexpr isize elements_offset = (sizeof(block_header) + alignof(T) - 1) / alignof(T) * alignof(T);

    static isize block_bytes(isize size) { return elements_offset + size * isize(sizeof(T)); }

    static T* elements_of(block_header* block)
    {
        return reinterpret_cast<T*>(reinterpret_cast<sc::byte*>(block) + elements_offset); // NOLINT
    }

    static void free_block(block_header* block)
    {
        ::operator delete(static_cast<void*>(block), std::align_val_t(block_alignment));
    }

    /// Allocates a block for `size` elements and lets `construct` create them.
    /// If construction throws, the already constructed elements are destroyed and the block is freed.
    template <class ConstructF>
    static block_header* create_block(isize size, ConstructF&& construct)
    {
        SC_ASSERT_ARG(size >= 0, "cow_array size must be non-negative");

        auto const memory = ::operator new(block_bytes(size), std::align_val_t(block_alignment));
        auto const block = new (sc::placement_new, memory) block_header{.ref_count = 1, .size = size};

        auto const obj_start = elements_of(block);
        auto obj_end = obj_start;
        try
        {
            construct(obj_end);
        }
        catch (...)
        {
            impl::destroy_objects_in_reverse(obj_start, obj_end);
            free_block(block);
            throw;
        }

        SC_ASSERT(obj_end - obj_start == size, "element construction did not fill the block");
        return block;
    }

    /// Drops one share of the block; the last share destroys the elements and frees it.
    static void release(block_header* block)
    {
        if (!block)
            return;

        if (--block->ref_count > 0)
            return;

        auto const obj_start = elements_of(block);
        impl::destroy_objects_in_reverse(obj_start, obj_start + block->size);
        free_block(block);
    }

    // members
private:
    block_header* _block = nullptr;
};
