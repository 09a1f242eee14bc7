// ordered_tree.hpp
// Unbalanced binary search tree ordered by a caller-supplied three-way
// comparator.
// -----------------------------------------------------------
// * insert() overwrites the stored value when an equal value is already
//   present (last write wins); the node count is unchanged in that case.
// * No rebalancing: the shape depends entirely on insertion order, so
//   sorted input produces a linear chain.
// * Not thread-safe.  Wrap the whole tree in a mutex if it is shared.

#ifndef GDS_ORDERED_TREE_HPP
#define GDS_ORDERED_TREE_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace gds
{

    /*-------------------------------------------------------------------------
     *  OrderFn<T>
     *-------------------------------------------------------------------------
     *  Three-way comparator: negative if a < b, zero if a == b, positive if
     *  a > b.  The conventional results are -1, 0 and 1 but only the sign is
     *  inspected.  Must describe a strict total order that does not change
     *  between calls.
     *-------------------------------------------------------------------------*/
    template <typename T>
    using OrderFn = std::function<int(const T &, const T &)>;

    /*-------------------------------------------------------------------------
     *  struct TreeNode<T>
     *-------------------------------------------------------------------------
     *  val          – the stored element.
     *  left,right   – owning child links; nullptr marks an empty branch.
     *
     *  Every node is owned by exactly one parent link (or by the tree's
     *  root slot), so the node graph is a proper tree with no sharing.
     *-------------------------------------------------------------------------*/
    template <typename T>
    struct TreeNode
    {
        T val;

        TreeNode *left{nullptr};
        TreeNode *right{nullptr};

        explicit TreeNode(const T &v) : val(v) {}
    };

    template <typename T>
    class OrderedTree
    {
    public:
        using NodeT = TreeNode<T>;

        /*───────────────────────────────────────────────────────────────────────────
          Constructor
          ───────────
          • Binds the tree to `order` for its whole lifetime.
          • The root slot starts empty, meaning “empty tree.”
         ──────────────────────────────────────────────────────────────────────────*/
        explicit OrderedTree(OrderFn<T> order) : order_fn(std::move(order)) {}

        ~OrderedTree() { destroy(); }

        /*───────────────────────────────────────────────────────────────────────────
          Copy disabled, move transfers the node graph
          ────────────────────────────────────────────
          • A shallow copy would free every node twice.
          • The moved-from tree is left empty but keeps its comparator.
         ──────────────────────────────────────────────────────────────────────────*/
        OrderedTree(const OrderedTree &) = delete;
        OrderedTree &operator=(const OrderedTree &) = delete;

        //  The comparator is copied *before* any node changes hands, so a
        //  throwing copy leaves both trees exactly as they were.
        OrderedTree(OrderedTree &&other) : order_fn(other.order_fn)
        {
            root = std::exchange(other.root, nullptr);
            count = std::exchange(other.count, 0);
        }

        OrderedTree &operator=(OrderedTree &&other)
        {
            if (this != &other)
            {
                OrderFn<T> order = other.order_fn;

                destroy();
                root = std::exchange(other.root, nullptr);
                count = std::exchange(other.count, 0);
                order_fn.swap(order);
            }
            return *this;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  INSERT
        //
        //  • Walks down from the root holding a pointer to the *link slot*
        //    (root, or some node's left/right) that the next node hangs from.
        //  • value < node → follow left slot; value > node → follow right slot.
        //  • value == node → overwrite node->val in place, no size++.
        //  • Falling off the tree means the current slot is empty: the new
        //    node is stored there and becomes owned by that parent.
        //
        //  Complexity: O(depth); O(n) for a degenerate chain.
        // ────────────────────────────────────────────────────────────────────────
        void insert(const T &v)
        {
            NodeT **slot = &root;

            while (*slot != nullptr)
            {
                NodeT *n = *slot;
                const int order = order_fn(v, n->val);

                if (order < 0)
                    slot = &n->left;
                else if (order > 0)
                    slot = &n->right;
                else
                {
                    n->val = v; // duplicate → last write wins
                    return;
                }
            }

            *slot = new NodeT(v);
            ++count;
        }

        /* Same descent as insert(); true as soon as a node compares equal. */
        bool contains(const T &v) const
        {
            return find_node(v) != nullptr;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  lookup
        //
        //  Returns a *copy* of the stored value that compares equal to `v`,
        //  or std::nullopt if the descent falls off the tree.  For records
        //  carrying data outside the comparator's key this exposes whichever
        //  value was inserted last.
        // ────────────────────────────────────────────────────────────────────────
        std::optional<T> lookup(const T &v) const
        {
            const NodeT *n = find_node(v);
            if (n == nullptr)
                return std::nullopt;
            return n->val;
        }

        std::size_t size() const { return count; }
        bool empty() const { return count == 0; }

        /*───────────────────────────────────────────────────────────────────────────
          height()
          --------
          Number of nodes on the longest root-to-leaf path (0 when empty).
          Sorted insertion yields height() == size().
          Uses an explicit stack so deep chains do not exhaust the call stack.
         ──────────────────────────────────────────────────────────────────────────*/
        std::size_t height() const
        {
            std::size_t best = 0;
            std::vector<std::pair<const NodeT *, std::size_t>> pending;
            if (root != nullptr)
                pending.emplace_back(root, 1);

            while (!pending.empty())
            {
                auto [n, depth] = pending.back();
                pending.pop_back();

                if (depth > best)
                    best = depth;
                if (n->left != nullptr)
                    pending.emplace_back(n->left, depth + 1);
                if (n->right != nullptr)
                    pending.emplace_back(n->right, depth + 1);
            }
            return best;
        }

        /*───────────────────────────────────────────────────────────────────────────
          validate()
          ----------
          Debugging aid.  Verifies that
            (1) every value in a left subtree compares less than its ancestor
                and every value in a right subtree compares greater, and
            (2) size() matches the number of reachable nodes.
          Each node is checked against the tightest (low, high) bounds
          inherited from its ancestors, not just its direct parent.
         ──────────────────────────────────────────────────────────────────────────*/
        bool validate() const
        {
            struct Frame
            {
                const NodeT *n;
                const T *low;  // exclusive lower bound, nullptr = unbounded
                const T *high; // exclusive upper bound, nullptr = unbounded
            };

            std::size_t seen = 0;
            std::vector<Frame> pending;
            if (root != nullptr)
                pending.push_back({root, nullptr, nullptr});

            while (!pending.empty())
            {
                Frame f = pending.back();
                pending.pop_back();
                ++seen;

                if (f.low != nullptr && order_fn(*f.low, f.n->val) >= 0)
                    return false;
                if (f.high != nullptr && order_fn(f.n->val, *f.high) >= 0)
                    return false;

                if (f.n->left != nullptr)
                    pending.push_back({f.n->left, f.low, &f.n->val});
                if (f.n->right != nullptr)
                    pending.push_back({f.n->right, &f.n->val, f.high});
            }
            return seen == count;
        }

    private:
        /* Top of the tree; nullptr when empty. */
        NodeT *root{nullptr};

        /* Number of distinct (under order_fn) values stored. */
        std::size_t count{0};

        /* Comparator fixed at construction.  Every left/right decision and
         * every equality test goes through it; operator< / operator== on T
         * are never used. */
        OrderFn<T> order_fn;

        const NodeT *find_node(const T &v) const
        {
            const NodeT *n = root;
            while (n != nullptr)
            {
                const int order = order_fn(v, n->val);
                if (order < 0)
                    n = n->left;
                else if (order > 0)
                    n = n->right;
                else
                    return n;
            }
            return nullptr;
        }

        /*────────────────────────────────────────────────────────────────────────────
         *  destroy
         *  ------------------------------------------------------------------------
         *  Frees every node and leaves the tree empty.  Iterative so that a
         *  degenerate chain of any length can be released.
         *──────────────────────────────────────────────────────────────────────────*/
        void destroy()
        {
            std::vector<NodeT *> pending;
            if (root != nullptr)
                pending.push_back(root);

            while (!pending.empty())
            {
                NodeT *n = pending.back();
                pending.pop_back();
                if (n->left != nullptr)
                    pending.push_back(n->left);
                if (n->right != nullptr)
                    pending.push_back(n->right);
                delete n;
            }

            root = nullptr;
            count = 0;
        }
    };

} // namespace gds

#endif // GDS_ORDERED_TREE_HPP
