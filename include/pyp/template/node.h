/***
 * Name: pyp::tmpl (node tree)
 * Purpose: Tree produced by the block parser and consumed by the code generator.
 * Inputs: Constructed by ParseTemplate()
 * Outputs: Ordered statements and nested control blocks
 * Theory of Operation: Node stores a kind tag; every child is exclusively owned
 *   through unique_ptr. A ControlSequence holds one ControlBlock per clause
 *   (`if`, then each `elif`/`else`) sharing one indentation level.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "pyp/template/syntax.h"

namespace pyp {
namespace tmpl {

enum class NodeKind { Statement, Sequence, ControlSequence };

struct Node {
  explicit Node(NodeKind k) : kind(k) {}
  virtual ~Node() = default;
  NodeKind kind;
};

using NodeList = std::vector<std::unique_ptr<Node>>;

/***
 * Name: pyp::tmpl::StatementLine
 * Purpose: One line of generated Python.
 * Theory of Operation: A verbatim line is emitted exactly as stored and is never
 *   indented (continuation lines of a triple-quoted string in a `<% %>` block).
 */
struct StatementLine : public Node {
  explicit StatementLine(std::string t, bool is_verbatim = false)
      : Node(NodeKind::Statement), text(std::move(t)), verbatim(is_verbatim) {}
  std::string text;
  bool verbatim;
};

struct Sequence : public Node {
  Sequence() : Node(NodeKind::Sequence) {}
  NodeList nodes;
};

/*** ControlBlock: One clause: its header statement and body. */
struct ControlBlock {
  std::string header{};
  std::string word{};  // "if", "elif", "except", ...
  int line{0};         // template line of the clause directive
  NodeList nodes{};
};

struct ControlSequence : public Node {
  ControlSequence(ControlKeyword kw, int opened_at, bool accumulating)
      : Node(NodeKind::ControlSequence), keyword(kw), line(opened_at), accumulates(accumulating) {}
  ControlKeyword keyword;
  int line;
  bool accumulates;  // literal lines append to _OUTPUT (inside a pypdef)
  std::vector<ControlBlock> blocks;
};

/***
 * Name: pyp::tmpl::make_node
 * Purpose: Template factory for tree nodes.
 * Inputs: Constructor args for NodeType
 * Outputs: std::unique_ptr<NodeType>
 * Theory of Operation: Forwards args to NodeType constructor.
 */
template <typename NodeType, typename... Args>
std::unique_ptr<NodeType> make_node(Args&&... args) {
  return std::make_unique<NodeType>(std::forward<Args>(args)...);
}

/*** add_child: Move a node to the end of a node list. */
template <typename ChildNode>
void add_child(NodeList& list, std::unique_ptr<ChildNode> child) {
  list.emplace_back(std::move(child));
}

}  // namespace tmpl
}  // namespace pyp
