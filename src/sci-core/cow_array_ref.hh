#pragma once

#include <sci-core/assert.hh>
#include <sci-core/cow_array.hh>
#include <sci-core/fwd.hh>
#include <sci-core/utility.hh>

#include <initializer_list>
#include <new>
#include <type_traits>

/// Shared handle to one cow_array<T>: the container reference held by array views.
///
/// Two levels of sharing are involved:
/// - copies of a cow_array_ref refer to the same cow_array object, so a write through one copy is
///   visible through all of them (views of one vector alias each other)
/// - the referenced cow_array shares its elements copy-on-write with other cow_arrays, so a write
///   through this reference forks away from e.g. the owning array it was created from
///
/// A default-constructed cow_array_ref refers to nothing and reports is_initialized() == false.
/// The handle count is a plain integer (single-threaded, like cow_array).
template <class T>
struct sc::cow_array_ref
{
    using value_type = T;

    template <class U>
    using rebind = cow_array_ref<U>;

    // construction
public:
    cow_array_ref() = default;

    /// Builds the referenced cow_array in place from the arguments.
    /// Passing a cow_array shares its elements copy-on-write.
    template <class... Args>
        requires(sizeof...(Args) > 0 && std::is_constructible_v<cow_array<T>, Args...>)
    explicit cow_array_ref(Args&&... args) : _shared(create_shared(sc::forward<Args>(args)...))
    {
    }

    cow_array_ref(std::initializer_list<T> init) : _shared(create_shared(init)) {}

    // reference semantics
public:
    cow_array_ref(cow_array_ref const& rhs) : _shared(rhs._shared)
    {
        if (_shared)
            ++_shared->handle_count;
    }

    cow_array_ref(cow_array_ref&& rhs) noexcept : _shared(sc::exchange(rhs._shared, nullptr)) {}

    cow_array_ref& operator=(cow_array_ref const& rhs)
    {
        cow_array_ref tmp(rhs);
        swap_handles(*this, tmp);
        return *this;
    }

    cow_array_ref& operator=(cow_array_ref&& rhs) noexcept
    {
        cow_array_ref tmp(sc::move(rhs));
        swap_handles(*this, tmp);
        return *this;
    }

    ~cow_array_ref()
    {
        if (_shared && --_shared->handle_count == 0)
            destroy_shared(_shared);
    }

    // element access
public:
    /// Mutable pointer to the elements; forks them if the referenced array shares them.
    /// nullptr if uninitialized.
    [[nodiscard]] T* data() { return _shared ? _shared->array.data() : nullptr; }

    /// Read-only pointer to the elements, nullptr if uninitialized.
    [[nodiscard]] T const* cdata() const { return _shared ? _shared->array.cdata() : nullptr; }

    /// The referenced array.
    /// Precondition: a cow_array is referenced (the array itself may still be uninitialized).
    [[nodiscard]] cow_array<T>& array()
    {
        SC_ASSERT_STATE(_shared != nullptr, "array() called on an empty cow_array_ref");
        return _shared->array;
    }
    [[nodiscard]] cow_array<T> const& array() const
    {
        SC_ASSERT_STATE(_shared != nullptr, "array() called on an empty cow_array_ref");
        return _shared->array;
    }

    // queries
public:
    [[nodiscard]] bool is_initialized() const { return _shared && _shared->array.is_initialized(); }
    [[nodiscard]] isize size() const { return _shared ? _shared->array.size() : 0; }
    /// Number of handles referring to the same array (0 if empty).
    [[nodiscard]] isize ref_count() const { return _shared ? _shared->handle_count : 0; }
    [[nodiscard]] bool same_array_as(cow_array_ref const& rhs) const { return _shared && _shared == rhs._shared; }

    // handle management
private:
    struct shared_array
    {
        isize handle_count;
        cow_array<T> array;
    };

    /// Allocates the shared block and builds the referenced cow_array in it.
    /// If the cow_array constructor throws, the memory is freed again.
    template <class... Args>
    static shared_array* create_shared(Args&&... args)
    {
        auto const memory = ::operator new(sizeof(shared_array));
        try
        {
            return new (sc::placement_new, memory) shared_array{1, cow_array<T>(sc::forward<Args>(args)...)};
        }
        catch (...)
        {
            ::operator delete(memory);
            throw;
        }
    }

    static void destroy_shared(shared_array* shared)
    {
        shared->~shared_array();
        ::operator delete(static_cast<void*>(shared));
    }

    static void swap_handles(cow_array_ref& a, cow_array_ref& b) noexcept
    {
        auto const tmp = a._shared;
        a._shared = b._shared;
        b._shared = tmp;
    }

    // members
private:
    shared_array* _shared = nullptr;
};
