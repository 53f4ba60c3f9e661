#pragma once

#include "setpart_engine/types.hpp"
#include <cstddef>
#include <deque>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace setpart {

// Upper bound on the arena size build_tree accepts unless told otherwise.
constexpr std::size_t kDefaultMaxTreeNodes = 1u << 16;

// (0,0), (n,0) with n > 0 and (n,n).
bool is_base_case(int n, int k);

// Node count of the call tree S(n,k) expands into, 0 when k < 0 or k > n.
// Anything larger than limit is reported as limit + 1.
std::size_t call_tree_size(int n, int k, std::size_t limit = std::numeric_limits<std::size_t>::max());

// Full unshared recursion tree of S(n,k), values pending.
// Throws InvalidRequest for n < 0, k < 0, k > n, or a tree larger than maxNodes.
Tree build_tree(int n, int k, std::size_t maxNodes = kDefaultMaxTreeNodes);

// Post-order evaluation of every node; returns the root value.
BigCount resolve_values(Tree& tree);

TreeState tree_state(const Tree& tree);

// Lazy reveal sequence over a built tree. The tree must outlive the cursor.
struct TraceCursor {
    const Tree* tree = nullptr;
    TraceOrder order = TraceOrder::Dfs;
    std::deque<int> frontier;
    std::size_t emitted = 0;
};

TraceCursor trace(const Tree& tree, TraceOrder order);
TraceCursor trace(const Tree&& tree, TraceOrder order) = delete;
// Next reveal event, or nullopt once every node has been revealed.
std::optional<RevealEvent> step(TraceCursor& cursor);
// Rewind to the first event; the tree is not rebuilt.
void reset(TraceCursor& cursor);
TraceState trace_state(const TraceCursor& cursor);

std::vector<RevealEvent> collect_trace(const Tree& tree, TraceOrder order);

// Node revealed at a given DFS step, clamped into range.
const TreeNode& node_at_step(const Tree& tree, std::size_t step);

// "S(4,2) = 7", or "S(4,2) = ?" while pending.
std::string node_label(const TreeNode& node);
// "2*S(3,2)" for KTimes edges, "S(3,1)" for MinusOne edges.
std::string term_label(const Tree& tree, const TreeEdge& edge);

} // namespace setpart
