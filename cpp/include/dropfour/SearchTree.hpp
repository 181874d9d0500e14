#pragma once

#include "dropfour/Constants.hpp"

#include <ostream>
#include <vector>

namespace dropfour {

constexpr node_ix_t kNullNodeIx = -1;

/*
 * Record of the nodes visited by one SearchEngine::search() call, kept when
 * SearchEngine::Params::record_tree is set. Used to show why the engine picked its move.
 *
 * Nodes live in a flat vector and link to each other by index. Node 0 is the root. Each node's
 * score is from the point of view of the player to move at that node (negamax convention), so a
 * child's score is negated when viewed from its parent. Children pruned by alpha-beta never appear;
 * a child whose subtree was cut short carries a bound rather than an exact score, flagged by
 * `exact == false`.
 */
class SearchTree {
 public:
  struct Node {
    column_t move = kNoMove;  // move from the parent; kNoMove for the root
    score_t score = 0;
    bool exact = true;
    node_ix_t first_child_ix = kNullNodeIx;
    node_ix_t last_child_ix = kNullNodeIx;
    node_ix_t next_sibling_ix = kNullNodeIx;
    node_ix_t best_child_ix = kNullNodeIx;
  };

  SearchTree() { clear(); }

  // Resets to a single root node.
  void clear();

  node_ix_t add_child(node_ix_t parent_ix, column_t move);
  void set_score(node_ix_t ix, score_t score, bool exact);
  void set_best_child(node_ix_t parent_ix, node_ix_t child_ix);

  const Node& node(node_ix_t ix) const { return nodes_[ix]; }
  const Node& root() const { return nodes_[0]; }
  int size() const { return nodes_.size(); }
  int num_children(node_ix_t ix) const;

  // Moves along the chain of best children starting at the root.
  std::vector<column_t> principal_variation() const;

  /*
   * Prints the tree, one node per line, indented by depth, down to max_depth plies below the root.
   * The best child at each level is marked with '*'. Example:
   *
   *  root: 277
   *   *4: -277
   *      4: 281
   *    3: -412
   *
   * A '~' before the score marks a bound rather than an exact value.
   */
  void print(std::ostream& os, int max_depth) const;

 private:
  void print_helper(std::ostream& os, node_ix_t ix, int depth, int max_depth, bool best) const;

  std::vector<Node> nodes_;
};

}  // namespace dropfour
