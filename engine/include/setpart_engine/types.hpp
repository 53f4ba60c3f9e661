#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace setpart {

// Exact counts: Bell(n) leaves 64 bits at n = 26.
using BigCount = boost::multiprecision::cpp_int;

// Raised at request time (first/last/count/build_tree) for a malformed n/k/mode combination.
class InvalidRequest : public std::invalid_argument {
public:
    explicit InvalidRequest(const std::string& what) : std::invalid_argument(what) {}
};

// Restricted growth string: element i+1 belongs to block rgs[i].
using Rgs = std::vector<int>;

// Blocks in label order (0,1,2,...); each block holds its 1-based elements ascending.
using Blocks = std::vector<std::vector<int>>;

enum class Mode {
    All,
    ExactK
};

// Block-count window admitted by a mode. The stepping code only ever sees this.
struct ModeBounds {
    int minBlocks = 0;
    int maxBlocks = 0;
};

struct Cursor {
    int n = 0;
    Mode mode = Mode::All;
    int k = 0; // used by ExactK
    ModeBounds bounds;
    Rgs rgs;
    // Restriction vector: prefixMax[i] = max(rgs[0..i-1]); prefixMax[0] = 0.
    std::vector<int> prefixMax;
    BigCount rank = 0; // 0-based position of rgs in the enumeration
    bool exhausted = false; // set when next() ran off the end
};

// Stirling recurrence tree
enum class NodeKind {
    Base,
    Recursive
};

// Which additive term of S(n,k) = k*S(n-1,k) + S(n-1,k-1) an edge stands for.
enum class Term {
    KTimes,
    MinusOne
};

struct TreeNode {
    int id = 0;
    int parentId = -1; // -1 denotes root
    int n = 0;
    int k = 0;
    int depth = 0;
    NodeKind kind = NodeKind::Base;
    std::optional<BigCount> value; // nullopt means pending
    std::vector<int> children; // ordered: KTimes child, then MinusOne child
    int incomingEdge = -1; // index into Tree::edges, -1 for root
};

struct TreeEdge {
    int parentId = 0;
    int childId = 0;
    Term term = Term::KTimes;
};

// Flat arena; nodes[0] is the root and ids follow depth-first pre-order.
struct Tree {
    std::vector<TreeNode> nodes;
    std::vector<TreeEdge> edges;
    bool resolved = false;
};

enum class TreeState {
    Built,
    Resolved
};

enum class TraceOrder {
    Dfs,
    Bfs
};

enum class TraceState {
    Ready,
    Stepping,
    Done
};

struct RevealEvent {
    int nodeId = 0;
    std::optional<TreeEdge> edge; // nullopt for the root
};

} // namespace setpart
