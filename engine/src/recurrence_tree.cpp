#include "setpart_engine/recurrence_tree.hpp"
#include <algorithm>
#include <limits>
#include <numeric>

namespace setpart {

bool is_base_case(int n, int k) {
    if (n == 0 && k == 0) return true;
    if (n > 0 && k == 0) return true;
    return n == k;
}

static BigCount base_value(int n, int k) {
    return (n == k) ? BigCount(1) : BigCount(0);
}

static std::string call_text(int n, int k) {
    return "S(" + std::to_string(n) + "," + std::to_string(k) + ")";
}

/*
 * T(n,k) = 1 at base cases, else 1 + T(n-1,k) + T(n-1,k-1).
 * T + 1 follows Pascal's rule with 2 at every base case, so T(n,k) = 2 C(n,k) - 1.
 * C(n-r+i, i) only grows with i, so the loop stops as soon as it passes the cap.
 */
std::size_t call_tree_size(int n, int k, std::size_t limit) {
    if (n < 0 || k < 0 || k > n) return 0;
    const std::size_t cap = limit == std::numeric_limits<std::size_t>::max() ? limit : limit + 1;
    const std::size_t binomCap = cap / 2 + 1;
    const int r = std::min(k, n - k);
    std::size_t binom = 1;
    for (int i = 1; i <= r; ++i) {
        // C(m,i) = C(m-1,i-1) * m / i; i / gcd divides m exactly
        std::size_t divisor = static_cast<std::size_t>(i);
        const std::size_t g = std::gcd(binom, divisor);
        binom /= g;
        divisor /= g;
        const std::size_t factor = static_cast<std::size_t>(n - r + i) / divisor;
        if (binom > binomCap / factor) return cap;
        binom *= factor;
    }
    if (binom > binomCap) return cap;
    return std::min(2 * binom - 1, cap);
}

Tree build_tree(int n, int k, std::size_t maxNodes) {
    if (n < 0 || k < 0) throw InvalidRequest("negative argument in " + call_text(n, k));
    if (k > n) throw InvalidRequest("no recurrence path for k > n in " + call_text(n, k));
    const std::size_t size = call_tree_size(n, k, maxNodes);
    if (size > maxNodes) {
        throw InvalidRequest("recursion tree of " + call_text(n, k) + " exceeds the limit of " +
                             std::to_string(maxNodes) + " nodes");
    }

    struct Pending {
        int parentId;
        Term term;
        int n;
        int k;
        int depth;
    };

    Tree tree;
    tree.nodes.reserve(size);
    tree.edges.reserve(size - 1);
    std::vector<Pending> work;
    work.push_back(Pending{ -1, Term::KTimes, n, k, 0 });
    while (!work.empty()) {
        Pending p = work.back();
        work.pop_back();

        TreeNode node;
        node.id = static_cast<int>(tree.nodes.size());
        node.parentId = p.parentId;
        node.n = p.n;
        node.k = p.k;
        node.depth = p.depth;
        if (p.parentId >= 0) {
            node.incomingEdge = static_cast<int>(tree.edges.size());
            tree.edges.push_back(TreeEdge{ p.parentId, node.id, p.term });
            tree.nodes[p.parentId].children.push_back(node.id);
        }
        if (is_base_case(p.n, p.k)) {
            node.kind = NodeKind::Base;
            node.value = base_value(p.n, p.k);
        } else {
            node.kind = NodeKind::Recursive;
            // LIFO: the KTimes subtree is expanded first, giving pre-order ids
            work.push_back(Pending{ node.id, Term::MinusOne, p.n - 1, p.k - 1, p.depth + 1 });
            work.push_back(Pending{ node.id, Term::KTimes, p.n - 1, p.k, p.depth + 1 });
        }
        tree.nodes.push_back(std::move(node));
    }
    return tree;
}

BigCount resolve_values(Tree& tree) {
    if (tree.nodes.empty()) throw InvalidRequest("recursion tree has not been built");
    // children always carry larger ids than their parent
    for (auto it = tree.nodes.rbegin(); it != tree.nodes.rend(); ++it) {
        TreeNode& node = *it;
        if (node.kind == NodeKind::Base) {
            node.value = base_value(node.n, node.k);
            continue;
        }
        const TreeNode& kTimes = tree.nodes[node.children[0]];
        const TreeNode& minusOne = tree.nodes[node.children[1]];
        node.value = BigCount(node.k * *kTimes.value + *minusOne.value);
    }
    tree.resolved = true;
    return *tree.nodes.front().value;
}

TreeState tree_state(const Tree& tree) {
    return tree.resolved ? TreeState::Resolved : TreeState::Built;
}

TraceCursor trace(const Tree& tree, TraceOrder order) {
    TraceCursor cursor;
    cursor.tree = &tree;
    cursor.order = order;
    reset(cursor);
    return cursor;
}

std::optional<RevealEvent> step(TraceCursor& cursor) {
    if (cursor.tree == nullptr || cursor.frontier.empty()) return std::nullopt;
    const Tree& tree = *cursor.tree;
    int id;
    if (cursor.order == TraceOrder::Dfs) {
        id = cursor.frontier.back();
        cursor.frontier.pop_back();
        const auto& children = tree.nodes[id].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) cursor.frontier.push_back(*it);
    } else {
        id = cursor.frontier.front();
        cursor.frontier.pop_front();
        for (int cid : tree.nodes[id].children) cursor.frontier.push_back(cid);
    }
    ++cursor.emitted;

    RevealEvent event;
    event.nodeId = id;
    int edgeIndex = tree.nodes[id].incomingEdge;
    if (edgeIndex >= 0) event.edge = tree.edges[edgeIndex];
    return event;
}

void reset(TraceCursor& cursor) {
    cursor.frontier.clear();
    cursor.emitted = 0;
    if (cursor.tree != nullptr && !cursor.tree->nodes.empty()) {
        cursor.frontier.push_back(0);
    }
}

TraceState trace_state(const TraceCursor& cursor) {
    if (cursor.frontier.empty()) return TraceState::Done;
    return cursor.emitted == 0 ? TraceState::Ready : TraceState::Stepping;
}

std::vector<RevealEvent> collect_trace(const Tree& tree, TraceOrder order) {
    std::vector<RevealEvent> events;
    events.reserve(tree.nodes.size());
    TraceCursor cursor = trace(tree, order);
    while (auto event = step(cursor)) {
        events.push_back(*event);
    }
    return events;
}

const TreeNode& node_at_step(const Tree& tree, std::size_t step) {
    if (tree.nodes.empty()) throw InvalidRequest("recursion tree has not been built");
    return tree.nodes[std::min(step, tree.nodes.size() - 1)];
}

std::string node_label(const TreeNode& node) {
    return call_text(node.n, node.k) + " = " + (node.value ? node.value->str() : std::string("?"));
}

std::string term_label(const Tree& tree, const TreeEdge& edge) {
    const TreeNode& child = tree.nodes[edge.childId];
    if (edge.term == Term::KTimes) {
        return std::to_string(child.k) + "*" + call_text(child.n, child.k);
    }
    return call_text(child.n, child.k);
}

} // namespace setpart
