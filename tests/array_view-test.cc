#include <sci-core/array_view.hh>

#include <nexus/test.hh>

#include "contract-check.hh"

#include <complex>
#include <vector>

namespace
{
template <class View>
std::vector<typename View::element_type> elements_of(View const& v)
{
    std::vector<typename View::element_type> result;
    for (sc::isize i = 0; i < v.size(); ++i)
        result.push_back(v.index(i));
    return result;
}

template <class View>
bool same_window(View const& a, View const& b)
{
    return a.first_index() == b.first_index() && a.size() == b.size() && a.stride() == b.stride()
        && a.container().same_array_as(b.container());
}

using ints = std::vector<int>;
using doubles = std::vector<double>;
using cdouble = std::complex<double>;
} // namespace

// type-level associations
static_assert(!sc::array_view<double>::is_strided);
static_assert(sc::strided_array_view<double>::is_strided);
static_assert(std::is_same_v<sc::array_view<double>::element_type, double>);
static_assert(std::is_same_v<sc::array_view<double>::container_type, sc::cow_array_ref<double>>);
static_assert(std::is_same_v<sc::array_view<double>::view_type, sc::array_view<double>>);
static_assert(std::is_same_v<sc::array_view<double>::strided_view_type, sc::strided_array_view<double>>);
static_assert(std::is_same_v<sc::strided_array_view<double>::view_type, sc::strided_array_view<double>>);
static_assert(std::is_same_v<sc::array_view<float>::transposed, sc::array_view<float, sc::vector_orientation::row>>);
static_assert(std::is_same_v<sc::strided_array_view<float, sc::vector_orientation::row>::transposed, sc::array_view<float>>);
static_assert(std::is_same_v<sc::array_view<float>::promote<double>, sc::array_view<double>>);
static_assert(std::is_same_v<sc::strided_array_view<float>::promote<sc::array_view<cdouble>>, sc::array_view<cdouble>>);
static_assert(std::is_same_v<sc::array_view<int, sc::vector_orientation::row>::promote<int>,
                             sc::array_view<int, sc::vector_orientation::row>>);
static_assert(sc::container_reference<sc::cow_array_ref<double>>);
static_assert(sc::container_reference<sc::cow_array<double>>);

TEST("array_view - construction")
{
    SECTION("default is empty and uninitialized")
    {
        sc::array_view<double> v;
        CHECK(v.empty());
        CHECK(v.size() == 0);
        CHECK(v.first_index() == 0);
        CHECK(v.stride() == 1);
        CHECK(v.cdata() == nullptr);
        CHECK(v.data() == nullptr);
        CHECK(!v.container().is_initialized());

        sc::strided_array_view<double> s;
        CHECK(s.stride() == 1);
        CHECK(s.empty());
    }

    SECTION("window over an existing container")
    {
        auto const c = sc::cow_array_ref<int>{10, 20, 30, 40, 50};

        auto const v = sc::array_view<int>(c, 1, 3);
        CHECK(v.first_index() == 1);
        CHECK(v.size() == 3);
        CHECK(elements_of(v) == ints{20, 30, 40});
        CHECK(v.container().same_array_as(c));
        CHECK(c.ref_count() == 2);

        auto const s = sc::strided_array_view<int>(c, 0, 3, 2);
        CHECK(s.stride() == 2);
        CHECK(elements_of(s) == ints{10, 30, 50});
    }

    SECTION("full view over a container")
    {
        auto const c = sc::cow_array_ref<int>{1, 2, 3};
        auto const v = sc::array_view<int>(c);
        CHECK(v.first_index() == 0);
        CHECK(v.size() == 3);
        CHECK(v.container().same_array_as(c));
    }

    SECTION("arguments build a fresh container")
    {
        auto const filled = sc::array_view<double>(4, 1.5);
        CHECK(filled.size() == 4);
        CHECK(filled.first_index() == 0);
        CHECK(elements_of(filled) == doubles{1.5, 1.5, 1.5, 1.5});
        CHECK(filled.container().ref_count() == 1);

        auto const zeros = sc::strided_array_view<double>(3);
        CHECK(zeros.stride() == 1);
        CHECK(elements_of(zeros) == doubles{0, 0, 0});

        auto const listed = sc::array_view<int>{7, 8, 9};
        CHECK(elements_of(listed) == ints{7, 8, 9});
    }

    SECTION("view over an owning array shares its elements")
    {
        auto owner = sc::cow_array<double>{1, 2, 3};
        auto const v = sc::array_view<double>(owner);
        CHECK(v.size() == 3);
        CHECK(v.cdata() == owner.cdata());
    }

    SECTION("invalid windows")
    {
        auto const c = sc::cow_array_ref<int>{1, 2, 3, 4};

        CHECK(sc::test::fails_with_invalid_argument([&] { sc::array_view<int>(c, -1, 2); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { sc::array_view<int>(c, 0, -1); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { sc::array_view<int>(c, 2, 3); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { sc::strided_array_view<int>(c, 0, 3, 2); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { sc::strided_array_view<int>(c, 0, 2, -1); }));

        auto const zero_stride = sc::test::capture_contract_failure([&] { sc::strided_array_view<int>(c, 0, 2, 0); });
        REQUIRE(zero_stride.has_value());
        CHECK(zero_stride->kind == sc::impl::assertion_kind::invalid_argument);
        CHECK(zero_stride->message == "zero stride in view construction");

        // a failed construction releases its share of the container
        CHECK(c.ref_count() == 1);
    }

    SECTION("empty windows are valid anywhere up to the end")
    {
        auto const c = sc::cow_array_ref<int>{1, 2, 3};
        auto const v = sc::array_view<int>(c, 3, 0);
        CHECK(v.empty());
        CHECK(v.cdata() == c.cdata() + 3);
    }
}

TEST("array_view - index mapping")
{
    auto const c = sc::cow_array_ref<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};

    auto const v = sc::array_view<int>(c, 2, 5);
    for (sc::isize i = 0; i < v.size(); ++i)
    {
        CHECK(v.map_index(i) == 2 + i);
        CHECK(v.index(i) == c.cdata()[2 + i]);
    }

    auto const s = sc::strided_array_view<int>(c, 1, 3, 3);
    for (sc::isize i = 0; i < s.size(); ++i)
    {
        CHECK(s.map_index(i) == 1 + i * 3);
        CHECK(s.index(i) == c.cdata()[1 + i * 3]);
    }

    CHECK(sc::test::fails_with_invalid_argument([&] { (void)v.index(5); }));
    CHECK(sc::test::fails_with_invalid_argument([&] { (void)v.index(-1); }));
    CHECK(sc::test::fails_with_invalid_argument([&] { (void)s.index(3); }));
}

TEST("array_view - element writes")
{
    SECTION("plain assignment")
    {
        auto v = sc::array_view<int>{1, 2, 3, 4};
        v.index_assign(2, 30);
        CHECK(elements_of(v) == ints{1, 2, 30, 4});
    }

    SECTION("compound assignment")
    {
        auto v = sc::array_view<int>{1, 2, 3, 4};
        v.index_assign<sc::assign_op::add>(0, 10);
        v.index_assign<sc::assign_op::sub>(1, 5);
        v.index_assign<sc::assign_op::mul>(2, 4);
        v.index_assign<sc::assign_op::div>(3, 2);
        CHECK(elements_of(v) == ints{11, -3, 12, 2});
    }

    SECTION("strided writes hit the mapped positions")
    {
        auto v = sc::array_view<int>{1, 2, 3, 4};
        auto s = v.view(0, 4, 2);
        s.index_assign(1, 0);
        CHECK(elements_of(v) == ints{1, 2, 0, 4});
    }

    SECTION("out of bounds")
    {
        auto v = sc::array_view<int>{1, 2, 3, 4};
        CHECK(sc::test::fails_with_invalid_argument([&] { v.index_assign(4, 0); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { v.index_assign<sc::assign_op::add>(-1, 0); }));
        CHECK(elements_of(v) == ints{1, 2, 3, 4});
    }
}

TEST("array_view - front and back")
{
    auto v = sc::strided_array_view<int>(sc::cow_array_ref<int>{1, 2, 3, 4, 5}, 0, 3, 2);

    CHECK(v.front() == 1);
    CHECK(v.back() == 5);

    v.set_front(-1);
    v.set_back(-5);
    CHECK(elements_of(v) == ints{-1, 3, -5});
    CHECK(v.container().cdata()[1] == 2);
}

TEST("array_view - sub-views")
{
    SECTION("contiguous base")
    {
        auto const base = sc::array_view<int>{10, 20, 30, 40, 50};

        auto const v = base.view(1, 4);
        CHECK(v.size() == 3);
        CHECK(v.first_index() == 1);
        CHECK(elements_of(v) == ints{20, 30, 40});
        CHECK(v.index(1) == 30);

        auto const s = v.view(0, 2, 2);
        static_assert(std::is_same_v<decltype(s), sc::strided_array_view<int> const>);
        CHECK(s.size() == 1);
        CHECK(s.stride() == 2);
        CHECK(s.first_index() == 1);
        CHECK(s.index(0) == 20);
    }

    SECTION("strides compose multiplicatively")
    {
        auto const base = sc::array_view<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};

        auto const s1 = base.view(1, 13, 2); // 1 3 5 7 9 11
        CHECK(s1.stride() == 2);
        CHECK(s1.size() == 6);

        auto const s2 = s1.view(1, 6, 2); // 3 7 11
        CHECK(s2.stride() == 4);
        CHECK(s2.size() == 3);
        CHECK(s2.first_index() == 3);
        CHECK(elements_of(s2) == ints{3, 7, 11});

        auto const s3 = s1.view(0, 5, 3); // ceil(5 / 3) == 2: 1 7
        CHECK(s3.size() == 2);
        CHECK(s3.stride() == 6);
        CHECK(elements_of(s3) == ints{1, 7});

        auto const tail = s1.view(4, 6); // same layout, same stride
        CHECK(tail.stride() == 2);
        CHECK(elements_of(tail) == ints{9, 11});
    }

    SECTION("empty ranges")
    {
        auto const base = sc::array_view<int>{1, 2, 3};
        CHECK(base.view(3, 3).empty());
        CHECK(base.view(1, 1, 5).empty());
        CHECK(base.slice(0, 3).size() == 3);
        CHECK(base.slice(0, 3, 2).size() == 2);
    }

    SECTION("invalid ranges")
    {
        auto const base = sc::array_view<int>{1, 2, 3};

        CHECK(sc::test::fails_with_invalid_argument([&] { (void)base.view(2, 1); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { (void)base.view(-1, 2); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { (void)base.view(0, 4); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { (void)base.slice(1, 4, 2); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { (void)base.view(0, 3, -2); }));

        auto const zero_stride = sc::test::capture_contract_failure([&] { (void)base.view(0, 3, 0); });
        REQUIRE(zero_stride.has_value());
        CHECK(zero_stride->kind == sc::impl::assertion_kind::invalid_argument);
        CHECK(zero_stride->message == "zero stride in view-of-view construction");
    }
}

TEST("array_view - aliasing and copy-on-write")
{
    auto owner = sc::cow_array<int>{1, 2, 3, 4, 5};

    auto v1 = sc::array_view<int>(owner);
    auto early = sc::array_view<int>(owner); // separate reference to the same elements
    auto v2 = v1.view(1, 4);

    early.index_assign(0, -100); // forks early away from owner and v1
    v2.index_assign(1, 99);      // forks v1/v2 away from owner, v1 sees it

    CHECK(v1.index(1 + 1) == 99);
    CHECK(elements_of(v1) == ints{1, 2, 99, 4, 5});
    CHECK(elements_of(early) == ints{-100, 2, 3, 4, 5});
    CHECK(owner[2] == 3);
    CHECK(owner[0] == 1);

    SECTION("further writes stay shared between sibling views")
    {
        v1.index_assign(1, 0);
        CHECK(v2.index(0) == 0);
    }

    SECTION("copies alias as well")
    {
        auto copy = v2;
        copy.index_assign(2, 44);
        CHECK(v1.index(3) == 44);
        CHECK(v1.container().ref_count() == 3);
    }
}

TEST("array_view - assignment has reference semantics")
{
    auto a = sc::array_view<int>{1, 2, 3};
    auto b = sc::strided_array_view<int>(sc::cow_array_ref<int>{4, 5, 6, 7}, 1, 2, 2);
    auto c = sc::strided_array_view<int>(a.container(), 0, 2, 2);

    c = b;
    CHECK(same_window(c, b));
    CHECK(elements_of(c) == ints{5, 7});
    CHECK(a.container().ref_count() == 1); // c released its share of a

    c.set_back(0);
    CHECK(b.back() == 0);

    sc::array_view<int> d;
    d.force_ref_sharing(a);
    CHECK(same_window(d, a));
    d.set_front(10);
    CHECK(a.front() == 10);

    d = d; // NOLINT
    CHECK(same_window(d, a));
}

TEST("array_view - shrinking")
{
    SECTION("strided pop_back and pop_front")
    {
        auto v = sc::strided_array_view<int>(sc::cow_array_ref<int>{1, 2, 3, 4, 5, 6}, 0, 3, 2);
        CHECK(elements_of(v) == ints{1, 3, 5});

        v.pop_back();
        CHECK(elements_of(v) == ints{1, 3});
        CHECK(v.size() == 2);
        CHECK(v.first_index() == 0);

        v.pop_front();
        CHECK(elements_of(v) == ints{3});
        CHECK(v.size() == 1);
        CHECK(v.first_index() == 2);
    }

    SECTION("pop_front k times shifts logical indices by k")
    {
        auto const original = sc::array_view<int>{0, 10, 20, 30, 40, 50, 60};
        auto const strided = original.view(0, 7, 2);

        for (sc::isize k = 0; k <= strided.size(); ++k)
        {
            auto v = strided;
            for (sc::isize j = 0; j < k; ++j)
                v.pop_front();

            CHECK(v.size() == strided.size() - k);
            for (sc::isize i = 0; i < v.size(); ++i)
            {
                CHECK(v.map_index(i) == strided.map_index(i + k));
                CHECK(v.index(i) == strided.index(i + k));
            }
        }
    }

    SECTION("shrinking leaves the container alone")
    {
        auto v = sc::array_view<int>{1, 2, 3};
        auto const* const ptr = v.cdata();
        v.pop_front();
        v.pop_back();
        CHECK(v.container().size() == 3);
        CHECK(v.cdata() == ptr + 1);
        CHECK(elements_of(v) == ints{2});
    }

    SECTION("operations on an empty view fail and change nothing")
    {
        auto full = sc::strided_array_view<int>(sc::cow_array_ref<int>{1, 2, 3}, 1, 1, 2);
        full.pop_front();
        REQUIRE(full.empty());

        auto const before = full;

        auto const pop_front = sc::test::capture_contract_failure([&] { full.pop_front(); });
        REQUIRE(pop_front.has_value());
        CHECK(pop_front->kind == sc::impl::assertion_kind::invalid_state);
        CHECK(pop_front->message == "pop_front() called on empty view");

        auto const pop_back = sc::test::capture_contract_failure([&] { full.pop_back(); });
        REQUIRE(pop_back.has_value());
        CHECK(pop_back->message == "pop_back() called on empty view");

        CHECK(sc::test::fails_with_invalid_state([&] { (void)full.front(); }));
        CHECK(sc::test::fails_with_invalid_state([&] { (void)full.back(); }));
        CHECK(sc::test::fails_with_invalid_state([&] { full.set_front(1); }));
        CHECK(sc::test::fails_with_invalid_state([&] { full.set_back(1); }));

        CHECK(same_window(full, before));
        CHECK(full.first_index() == 3);
        CHECK(full.size() == 0);
        CHECK(full.stride() == 2);
    }

    SECTION("a strided view popped empty still points into its container")
    {
        auto w = sc::strided_array_view<int>(sc::cow_array_ref<int>{0, 1, 2, 3, 4}, 0, 2, 4);
        w.pop_front();
        w.pop_front();
        REQUIRE(w.empty());
        CHECK(w.first_index() == 8);

        auto const* const base = w.container().cdata();
        CHECK(w.cdata() == base + 5);
        CHECK(w.as_const_strided_span().start_ptr() == base + 5);
        CHECK(w.as_const_strided_span().empty());

        auto const none = w.view(0, 0);
        CHECK(none.empty());
        CHECK(none.cdata() == base + 5);
        CHECK(w.dot(none) == 0);

        CHECK(w.data() == w.container().cdata() + 5);
    }
}

TEST("array_view - resize")
{
    SECTION("same length zero-fills")
    {
        auto base = sc::array_view<double>{1, 2, 3, 4, 5};
        auto s = base.view(0, 5, 2);
        s.resize(3);
        CHECK(elements_of(s) == doubles{0, 0, 0});
        CHECK(elements_of(base) == doubles{0, 2, 0, 4, 0});
    }

    SECTION("integer elements zero-fill as well")
    {
        auto v = sc::array_view<int>{7, 8};
        v.resize(2);
        CHECK(elements_of(v) == ints{0, 0});
    }

    SECTION("keep_contents only checks the length")
    {
        auto v = sc::array_view<double>{1, 2};
        v.resize(2, sc::keep_contents);
        CHECK(elements_of(v) == doubles{1, 2});
    }

    SECTION("length mismatch fails and changes nothing")
    {
        auto v = sc::array_view<double>{1, 2, 3};
        auto const before = v;

        auto const failure = sc::test::capture_contract_failure([&] { v.resize(2); });
        REQUIRE(failure.has_value());
        CHECK(failure->kind == sc::impl::assertion_kind::invalid_argument);
        CHECK(failure->message == "length mismatch in vector operation");

        CHECK(sc::test::fails_with_invalid_argument([&] { v.resize(4, sc::keep_contents); }));

        CHECK(same_window(v, before));
        CHECK(elements_of(v) == doubles{1, 2, 3});
    }

    SECTION("resizing an empty view to zero")
    {
        sc::array_view<double> v;
        v.resize(0);
        CHECK(v.empty());
    }
}

TEST("array_view - bulk numeric operations")
{
    SECTION("scale")
    {
        auto base = sc::array_view<double>{1, 2, 3, 4};
        base.view(1, 4, 2).scale(10);
        CHECK(elements_of(base) == doubles{1, 20, 3, 40});
    }

    SECTION("scaled_add between layouts")
    {
        auto y = sc::array_view<double>{1, 1, 1};
        auto const x = sc::array_view<double>{1, 0, 2, 0, 3}.view(0, 5, 2);
        y.scaled_add(2, x);
        CHECK(elements_of(y) == doubles{3, 5, 7});
        CHECK(elements_of(x) == doubles{1, 2, 3});
    }

    SECTION("dot")
    {
        auto const x = sc::array_view<double>{1, 2, 3};
        auto const y = sc::array_view<double>{4, 0, 5, 0, 6}.view(0, 5, 2);
        CHECK(x.dot(y) == 32);
        CHECK(y.dot(x) == 32);

        auto const a = sc::array_view<cdouble>{{1, 1}, {0, 2}};
        auto const b = sc::array_view<cdouble>{{1, 0}, {0, 1}};
        CHECK(a.dot(b) == cdouble(-1, 1));                     // (1 + i) + (2i)(i)
        CHECK(a.dot<sc::transpose::yes>(b) == cdouble(3, -1)); // (1 - i) + (-2i)(i)
    }

    SECTION("copy")
    {
        auto dest = sc::array_view<int>(6).view(0, 6, 2);
        auto const source = sc::array_view<int>{1, 2, 3};
        dest.copy(source);
        CHECK(elements_of(dest) == ints{1, 2, 3});
        CHECK(elements_of(sc::array_view<int>(dest.container())) == ints{1, 0, 2, 0, 3, 0});
    }

    SECTION("transposed copy conjugates")
    {
        auto dest = sc::array_view<cdouble>(2);
        dest.copy<sc::transpose::yes>(sc::array_view<cdouble>{{1, 2}, {3, -4}});
        CHECK(elements_of(dest) == std::vector<cdouble>{{1, -2}, {3, 4}});
    }

    SECTION("writes fork shared elements first")
    {
        auto owner = sc::cow_array<double>{1, 2, 3};
        auto v = sc::array_view<double>(owner);
        v.scale(2);
        CHECK(elements_of(v) == doubles{2, 4, 6});
        CHECK(owner[0] == 1);
    }

    SECTION("length mismatches fail before anything is written")
    {
        auto owner = sc::cow_array<double>{1, 2, 3};
        auto v = sc::array_view<double>(owner);
        auto const two = sc::array_view<double>{1, 1};

        CHECK(sc::test::fails_with_invalid_argument([&] { v.scaled_add(1, two); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { (void)v.dot(two); }));
        CHECK(sc::test::fails_with_invalid_argument([&] { v.copy(two); }));

        CHECK(elements_of(v) == doubles{1, 2, 3});
        CHECK(v.cdata() == owner.cdata()); // no fork happened
    }
}

TEST("array_view - materializing a strided view")
{
    auto const base = sc::array_view<double>{1, 2, 3, 4, 5};
    auto const odd = base.view(0, 5, 2);

    auto const copy = sc::array_view<double>(sc::cow_array<double>::create_copy_of(odd.as_const_strided_span()));
    CHECK(copy.stride() == 1);
    CHECK(elements_of(copy) == doubles{1, 3, 5});
    CHECK(!copy.container().same_array_as(base.container()));
}

TEST("array_view - raw access")
{
    auto base = sc::array_view<float>{1, 2, 3, 4, 5, 6};
    auto s = base.view(1, 6, 2);

    auto const cs = s.as_const_strided_span();
    CHECK(cs.size() == 3);
    CHECK(cs.stride() == 2);
    CHECK(cs.start_ptr() == base.cdata() + 1);
    CHECK(cs[2] == 6);

    auto const ms = s.as_strided_span();
    ms[0] = 0;
    CHECK(base.index(1) == 0);
    CHECK(s.data() == s.cdata());
}
