// person.hpp
// Two-field record with a three-way ordering, usable as an OrderedTree key.

#ifndef GDS_PERSON_HPP
#define GDS_PERSON_HPP

#include <ostream>
#include <string>

namespace gds
{

    struct Person
    {
        std::string name;
        int age{0};

        /* -1, 0 or 1; ordered by name, ties broken by age. */
        int compare(const Person &other) const;
    };

    bool operator==(const Person &a, const Person &b);
    bool operator!=(const Person &a, const Person &b);

    std::ostream &operator<<(std::ostream &os, const Person &p);

    /* Adapter with the OrderFn<Person> signature. */
    int compare_people(const Person &a, const Person &b);

} // namespace gds

#endif // GDS_PERSON_HPP
