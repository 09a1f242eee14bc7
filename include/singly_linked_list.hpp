// singly_linked_list.hpp
// Forward-only linked list of equality-comparable values.
// -----------------------------------------------------------
// * add() appends at the tail; there is no tail pointer, so it walks the
//   chain every time.
// * insert() past the end (or at a negative position) appends at the tail
//   instead of failing.
// * index() returns npos (-1) when the value is absent.

#ifndef GDS_SINGLY_LINKED_LIST_HPP
#define GDS_SINGLY_LINKED_LIST_HPP

#include <cstddef>
#include <utility>

namespace gds
{

    template <typename T>
    struct ListNode
    {
        T val;
        ListNode *next{nullptr};

        explicit ListNode(const T &v) : val(v) {}
    };

    template <typename T>
    class SinglyLinkedList
    {
    public:
        using NodeT = ListNode<T>;

        static constexpr std::ptrdiff_t npos = -1;

        SinglyLinkedList() = default;
        ~SinglyLinkedList() { destroy(); }

        SinglyLinkedList(const SinglyLinkedList &) = delete;
        SinglyLinkedList &operator=(const SinglyLinkedList &) = delete;

        SinglyLinkedList(SinglyLinkedList &&other) noexcept
            : head(std::exchange(other.head, nullptr)),
              count(std::exchange(other.count, 0))
        {
        }

        SinglyLinkedList &operator=(SinglyLinkedList &&other) noexcept
        {
            if (this != &other)
            {
                destroy();
                head = std::exchange(other.head, nullptr);
                count = std::exchange(other.count, 0);
            }
            return *this;
        }

        void add(const T &v)
        {
            NodeT **slot = &head;
            while (*slot != nullptr)
                slot = &(*slot)->next;

            *slot = new NodeT(v);
            ++count;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  insert(v, position)
        //
        //  • The new node ends up at zero-based `position`; everything from
        //    that position on shifts back by one.  position 0 → new head.
        //  • The walk stops at whichever comes first: the requested position
        //    or the end of the chain.  A position >= size() therefore appends
        //    at the true tail, and so does a negative one (it is never
        //    reached).
        //  • size() grows by exactly one in every case.
        // ────────────────────────────────────────────────────────────────────────
        void insert(const T &v, std::ptrdiff_t position)
        {
            NodeT **slot = &head;
            std::ptrdiff_t curr = 0;
            while (*slot != nullptr && curr != position)
            {
                slot = &(*slot)->next;
                ++curr;
            }

            NodeT *n = new NodeT(v);
            n->next = *slot;
            *slot = n;
            ++count;
        }

        /* Position of the first node equal to `v`, or npos. */
        std::ptrdiff_t index(const T &v) const
        {
            std::ptrdiff_t curr = 0;
            for (const NodeT *n = head; n != nullptr; n = n->next, ++curr)
            {
                if (n->val == v)
                    return curr;
            }
            return npos;
        }

        std::size_t size() const { return count; }
        bool empty() const { return count == 0; }

        /* Debugging aid: size() must equal the number of reachable nodes. */
        bool validate() const
        {
            std::size_t seen = 0;
            for (const NodeT *n = head; n != nullptr; n = n->next)
                ++seen;
            return seen == count;
        }

    private:
        NodeT *head{nullptr};
        std::size_t count{0};

        void destroy() noexcept
        {
            NodeT *n = head;
            while (n != nullptr)
            {
                NodeT *next = n->next;
                delete n;
                n = next;
            }
            head = nullptr;
            count = 0;
        }
    };

} // namespace gds

#endif // GDS_SINGLY_LINKED_LIST_HPP
