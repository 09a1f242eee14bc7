#include "person.hpp"

namespace gds
{

    namespace
    {
        template <typename T>
        int three_way(const T &a, const T &b)
        {
            if (a < b)
                return -1;
            if (b < a)
                return 1;
            return 0;
        }
    } // namespace

    int Person::compare(const Person &other) const
    {
        const int order = three_way(name, other.name);
        if (order != 0)
            return order;
        return three_way(age, other.age);
    }

    bool operator==(const Person &a, const Person &b)
    {
        return a.name == b.name && a.age == b.age;
    }

    bool operator!=(const Person &a, const Person &b)
    {
        return !(a == b);
    }

    std::ostream &operator<<(std::ostream &os, const Person &p)
    {
        return os << p.name << " (" << p.age << ")";
    }

    int compare_people(const Person &a, const Person &b)
    {
        return a.compare(b);
    }

} // namespace gds
