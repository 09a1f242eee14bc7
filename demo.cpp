#include "numeric.hpp"
#include "ordered_tree.hpp"
#include "person.hpp"
#include "print.hpp"
#include "singly_linked_list.hpp"

#include <cstdint>

using gds::util::println;

int main()
{
    // ── 1. ordered tree of ints ──────────────────────────────────────────
    gds::OrderedTree<int> numbers([](const int &a, const int &b)
                                  { return (a > b) - (a < b); });
    for (int v : {5, 3, 8, 3})
        numbers.insert(v);

    println("[tree] inserted 5, 3, 8, 3 -> {} nodes, height {}",
            numbers.size(), numbers.height());
    for (int probe : {3, 8, 9})
        println("  contains({}) = {}", probe, numbers.contains(probe));

    // ── 2. ordered tree of people ────────────────────────────────────────
    gds::OrderedTree<gds::Person> people(gds::compare_people);
    people.insert({"Fred", 32});
    people.insert({"Alice", 28});
    people.insert({"Bob", 41});
    people.insert({"Alice", 19});

    println("[people] {} people stored", people.size());
    println("  contains(Bob, 41) = {}", people.contains({"Bob", 41}));
    println("  contains(Bob, 42) = {}", people.contains({"Bob", 42}));

    // ── 3. singly linked list ────────────────────────────────────────────
    gds::SinglyLinkedList<int> list;
    list.add(1);
    list.add(2);
    list.insert(0, 0);
    list.insert(10, 99); // past the end → tail

    println("[list] {} elements", list.size());
    for (int v : {0, 1, 2, 10, 9})
        println("  index({}) = {}", v, list.index(v));

    // ── 4. numeric helpers ───────────────────────────────────────────────
    println("[numeric] double_value(21) = {}", gds::double_value(21));
    println("  double_value(1.25) = {}", gds::double_value(1.25));
    println("  double_value(int8_t{60}) = {}",
            static_cast<int>(gds::double_value(std::int8_t{60})));

    gds::PrintableFloat pi = 3.14159;
    gds::print_printable(pi);
    gds::print_printable(gds::PrintableFloat(gds::double_value(double(pi))));

    return 0;
}
