#include "dropfour/SearchTree.hpp"

#include "dropfour/Board.hpp"
#include "util/Asserts.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>

namespace dropfour {

void SearchTree::clear() {
  nodes_.clear();
  nodes_.emplace_back();
}

node_ix_t SearchTree::add_child(node_ix_t parent_ix, column_t move) {
  DEBUG_ASSERT(parent_ix >= 0 && parent_ix < size(), "Bad parent_ix {}", parent_ix);

  node_ix_t ix = nodes_.size();
  nodes_.emplace_back();
  nodes_[ix].move = move;

  Node& parent = nodes_[parent_ix];
  if (parent.last_child_ix == kNullNodeIx) {
    parent.first_child_ix = ix;
  } else {
    nodes_[parent.last_child_ix].next_sibling_ix = ix;
  }
  parent.last_child_ix = ix;
  return ix;
}

void SearchTree::set_score(node_ix_t ix, score_t score, bool exact) {
  nodes_[ix].score = score;
  nodes_[ix].exact = exact;
}

void SearchTree::set_best_child(node_ix_t parent_ix, node_ix_t child_ix) {
  nodes_[parent_ix].best_child_ix = child_ix;
}

int SearchTree::num_children(node_ix_t ix) const {
  int n = 0;
  for (node_ix_t c = nodes_[ix].first_child_ix; c != kNullNodeIx; c = nodes_[c].next_sibling_ix) {
    ++n;
  }
  return n;
}

std::vector<column_t> SearchTree::principal_variation() const {
  std::vector<column_t> moves;
  for (node_ix_t ix = root().best_child_ix; ix != kNullNodeIx; ix = nodes_[ix].best_child_ix) {
    moves.push_back(nodes_[ix].move);
  }
  return moves;
}

void SearchTree::print(std::ostream& os, int max_depth) const {
  print_helper(os, 0, 0, max_depth, false);
}

void SearchTree::print_helper(std::ostream& os, node_ix_t ix, int depth, int max_depth,
                              bool best) const {
  const Node& n = nodes_[ix];
  std::string indent(2 * depth, ' ');
  std::string label = ix == 0 ? "root" : Board::IO::move_to_str(n.move);
  os << fmt::format("{}{}{}: {}{}\n", indent, best ? "*" : " ", label, n.exact ? "" : "~",
                    n.score);

  if (depth >= max_depth) return;
  for (node_ix_t c = n.first_child_ix; c != kNullNodeIx; c = nodes_[c].next_sibling_ix) {
    print_helper(os, c, depth + 1, max_depth, c == n.best_child_ix);
  }
}

}  // namespace dropfour
