#ifdef __EMSCRIPTEN__
#include <emscripten/bind.h>
#include "setpart_engine/types.hpp"
#include "setpart_engine/enumerator.hpp"
#include "setpart_engine/recurrence_tree.hpp"
#include "setpart_engine/rgs_utils.hpp"

using namespace emscripten;
using namespace setpart;

// Owns one enumeration cursor per UI session.
// Requests return an empty string on success, otherwise the message for re-prompting.
class EnumeratorWasm {
public:
  EnumeratorWasm() : c_(first(0, Mode::All)) {}

  // mode: 0 = all partitions, 1 = exactly k blocks
  std::string start(int n, int mode, int k) {
    try {
      c_ = first(n, static_cast<Mode>(mode), k);
    } catch (const InvalidRequest& e) {
      return e.what();
    }
    return std::string();
  }
  std::string jumpToLast() {
    try {
      c_ = last(c_.n, c_.mode, c_.k);
    } catch (const InvalidRequest& e) {
      return e.what();
    }
    return std::string();
  }

  bool next() { return setpart::next(c_).has_value(); }
  bool previous() { return setpart::previous(c_).has_value(); }
  bool exhausted() const { return c_.exhausted; }

  val rgs() const {
    val arr = val::array();
    for (size_t i = 0; i < c_.rgs.size(); ++i) arr.set(i, c_.rgs[i]);
    return arr;
  }
  val blocks() const {
    val arr = val::array();
    auto bs = blocks_of(c_.rgs);
    for (size_t b = 0; b < bs.size(); ++b) {
      val block = val::array();
      for (size_t i = 0; i < bs[b].size(); ++i) block.set(i, bs[b][i]);
      arr.set(b, block);
    }
    return arr;
  }
  std::string blocksText() const { return format_blocks(blocks_of(c_.rgs)); }

  // Decimal strings: both can exceed 2^53.
  std::string rank() const { return c_.rank.str(); }
  std::string total() const { return count(c_.n, c_.mode, c_.k).str(); }

private:
  Cursor c_;
};

// Owns a recursion tree and its reveal trace. Nothing exists until build().
class RecurrenceTreeWasm {
public:
  std::string build(int n, int k, int order) {
    try {
      tree_ = build_tree(n, k);
    } catch (const InvalidRequest& e) {
      tree_.reset();
      cursor_ = TraceCursor();
      return e.what();
    }
    cursor_ = trace(*tree_, static_cast<TraceOrder>(order));
    return std::string();
  }

  std::string resolve() {
    if (!tree_) return std::string();
    return resolve_values(*tree_).str();
  }

  int nodeCount() const { return tree_ ? static_cast<int>(tree_->nodes.size()) : 0; }

  // Next reveal event as {id, n, k, depth, base, value, label, parent, term, termLabel},
  // or null at the end. The root carries a null parent and no term fields.
  val step() {
    if (!tree_) return val::null();
    auto event = setpart::step(cursor_);
    if (!event) return val::null();
    const TreeNode& node = tree_->nodes[event->nodeId];
    val out = val::object();
    out.set("id", node.id);
    out.set("n", node.n);
    out.set("k", node.k);
    out.set("depth", node.depth);
    out.set("base", node.kind == NodeKind::Base);
    out.set("value", node.value ? val(node.value->str()) : val::null());
    out.set("label", node_label(node));
    if (event->edge) {
      out.set("parent", event->edge->parentId);
      out.set("term", event->edge->term == Term::KTimes ? std::string("k_times") : std::string("minus_one"));
      out.set("termLabel", term_label(*tree_, *event->edge));
    } else {
      out.set("parent", val::null());
    }
    return out;
  }

  void reset() { setpart::reset(cursor_); }
  bool done() const { return trace_state(cursor_) == TraceState::Done; }

private:
  std::optional<Tree> tree_;
  TraceCursor cursor_;
};

EMSCRIPTEN_BINDINGS(setpart_engine_module) {
  class_<EnumeratorWasm>("Enumerator")
      .constructor<>()
      .function("start", &EnumeratorWasm::start)
      .function("jumpToLast", &EnumeratorWasm::jumpToLast)
      .function("next", &EnumeratorWasm::next)
      .function("previous", &EnumeratorWasm::previous)
      .function("exhausted", &EnumeratorWasm::exhausted)
      .function("rgs", &EnumeratorWasm::rgs)
      .function("blocks", &EnumeratorWasm::blocks)
      .function("blocksText", &EnumeratorWasm::blocksText)
      .function("rank", &EnumeratorWasm::rank)
      .function("total", &EnumeratorWasm::total);

  class_<RecurrenceTreeWasm>("RecurrenceTree")
      .constructor<>()
      .function("build", &RecurrenceTreeWasm::build)
      .function("resolve", &RecurrenceTreeWasm::resolve)
      .function("nodeCount", &RecurrenceTreeWasm::nodeCount)
      .function("step", &RecurrenceTreeWasm::step)
      .function("reset", &RecurrenceTreeWasm::reset)
      .function("done", &RecurrenceTreeWasm::done);
}

#endif // __EMSCRIPTEN__
