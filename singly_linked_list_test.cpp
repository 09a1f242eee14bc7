// singly_linked_list_test.cpp
// Functional tests for gds::SinglyLinkedList.
// Build: see CMakeLists.txt (target singly_linked_list_test); asserts stay enabled.

#include <cassert>
#include <string>
#include <utility>
#include <vector>

#include "print.hpp"
#include "singly_linked_list.hpp"

using gds::util::println;

namespace
{

template <typename T>
void expect_order(const gds::SinglyLinkedList<T> &list, const std::vector<T> &expected)
{
    // Assumes distinct values so index() identifies each element's slot.
    assert(list.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i)
        assert(list.index(expected[i]) == static_cast<std::ptrdiff_t>(i));
    assert(list.validate());
}

void test_empty_list()
{
    gds::SinglyLinkedList<int> list;

    assert(list.empty());
    assert(list.size() == 0);
    assert(list.index(0) == -1);
    assert(list.index(42) == gds::SinglyLinkedList<int>::npos);
    assert(list.validate());

    println("  ✔ empty list");
}

void test_add_then_insert_at_head()
{
    gds::SinglyLinkedList<int> list;
    list.add(1);
    list.add(2);
    list.insert(0, 0);

    expect_order(list, {0, 1, 2});
    assert(list.size() == 3);
    assert(list.index(2) == 2);
    assert(list.index(9) == -1);

    println("  ✔ add(1), add(2), insert(0, 0)");
}

void test_add_preserves_append_order()
{
    gds::SinglyLinkedList<std::string> list;
    const std::vector<std::string> words = {"alpha", "beta", "gamma", "delta"};
    for (const auto &w : words)
        list.add(w);

    expect_order(list, words);
    assert(list.index("epsilon") == -1);

    println("  ✔ add() keeps append order");
}

void test_index_returns_first_match()
{
    gds::SinglyLinkedList<int> list;
    for (int v : {7, 3, 7, 3, 9})
        list.add(v);

    assert(list.size() == 5);
    assert(list.index(7) == 0);
    assert(list.index(3) == 1);
    assert(list.index(9) == 4);

    list.insert(9, 0);
    assert(list.index(9) == 0);
    assert(list.validate());

    println("  ✔ index() reports first match");
}

void test_insert_in_the_middle()
{
    gds::SinglyLinkedList<int> list;
    for (int v : {10, 20, 40})
        list.add(v);

    list.insert(30, 2);
    expect_order(list, {10, 20, 30, 40});

    list.insert(15, 1);
    expect_order(list, {10, 15, 20, 30, 40});

    // position == size() is the slot just past the tail
    list.insert(50, 5);
    expect_order(list, {10, 15, 20, 30, 40, 50});

    println("  ✔ positional insert shifts later elements");
}

void test_insert_past_end_appends()
{
    gds::SinglyLinkedList<int> list;
    list.insert(1, 10); // empty list: becomes the head
    expect_order(list, {1});

    list.add(2);
    list.insert(3, 100);
    expect_order(list, {1, 2, 3});
    assert(list.size() == 3);

    list.insert(4, -1); // never reached → tail
    expect_order(list, {1, 2, 3, 4});

    gds::SinglyLinkedList<int> via_add;
    for (int v : {1, 2, 3, 4})
        via_add.add(v);
    for (int v : {1, 2, 3, 4})
        assert(via_add.index(v) == list.index(v));

    println("  ✔ out-of-range insert appends at tail");
}

void test_insert_zero_always_becomes_head()
{
    gds::SinglyLinkedList<int> list;
    for (int v = 0; v < 50; ++v)
    {
        list.insert(v, 0);
        assert(list.index(v) == 0);
        assert(list.size() == static_cast<std::size_t>(v + 1));
    }
    // Reverse order: the first value inserted is now last.
    assert(list.index(0) == 49);
    assert(list.validate());

    println("  ✔ insert(v, 0) makes v the head");
}

void test_long_chain_and_move()
{
    constexpr int N = 5'000;

    gds::SinglyLinkedList<int> list;
    for (int i = 0; i < N; ++i)
        list.insert(i, i);
    assert(list.size() == static_cast<std::size_t>(N));
    assert(list.index(N - 1) == N - 1);

    gds::SinglyLinkedList<int> moved(std::move(list));
    assert(moved.size() == static_cast<std::size_t>(N));
    assert(list.empty());
    assert(list.index(0) == -1);

    gds::SinglyLinkedList<int> target;
    target.add(-1);
    target = std::move(moved);
    assert(target.size() == static_cast<std::size_t>(N));
    assert(target.index(-1) == -1);
    assert(target.validate());

    println("  ✔ {}-node chain, move construction / assignment", N);
}

} // namespace

int main()
{
    println("==== SinglyLinkedList tests ====");

    test_empty_list();
    test_add_then_insert_at_head();
    test_add_preserves_append_order();
    test_index_returns_first_match();
    test_insert_in_the_middle();
    test_insert_past_end_appends();
    test_insert_zero_always_becomes_head();
    test_long_chain_and_move();

    println("ALL SINGLY LINKED LIST TESTS PASSED");
    return 0;
}
