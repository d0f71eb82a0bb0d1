/*
 * Copyright (C) 2010 Vyatta, Inc.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef _CTREE_HPP_
#define _CTREE_HPP_
#include <vector>
#include <string>
#include <set>

#include <common/error.hpp>
#include <ctree/ctree-util.hpp>
#include <remed/remed-data.hpp>

namespace ctree {

/* one configuration line. the root of a tree is a node with empty text
 * and no parent; it is not itself a command.
 */
class CfgNode : public TreeNode<CfgNode>, public remed::RemedData {
public:
  explicit CfgNode(const std::string& text = "");
  ~CfgNode() {}

  const std::string& getText() const { return _text; }

  bool isRoot() const { return (getParent() == 0); }
  bool isLeaf() const { return (numChildNodes() == 0); }
  // root is at depth 0, top-level lines at depth 1
  size_t depth() const;
  // texts from the top-level ancestor down to (and including) this node
  void getPath(std::vector<std::string>& path) const;

  const std::set<std::string>& getTags() const { return _tags; }
  bool hasTag(const std::string& tag) const;
  void addTag(const std::string& tag) { _tags.insert(tag); }

  const std::set<std::string>& getComments() const { return _comments; }
  void addComment(const std::string& comment) { _comments.insert(comment); }

  bool hasOrderWeight() const { return _has_order_weight; }
  int getOrderWeight() const { return (_has_order_weight ? _order_weight : 0); }
  void setOrderWeight(int weight) {
    _order_weight = weight;
    _has_order_weight = true;
  }

  // the "occurrence"-th child with the given text (only >0 for duplicates)
  CfgNode *findChild(const std::string& text, size_t occurrence = 0) const;
  size_t countChildren(const std::string& text) const;
  /* return the existing child with this text, or append a new one. if
   * force_duplicate is set, always append. returns NULL for empty text.
   */
  CfgNode *addChild(const std::string& text, bool force_duplicate = false);
  // delete the first child with this text (and its subtree)
  bool deleteChild(const std::string& text);

  // copy of this node without children (metadata included)
  CfgNode *copyShallow() const;
  CfgNode *copyDeep() const;

  // number of nodes in the subtree, this node included
  size_t subtreeSize() const;

  /* same text and, recursively, the same children texts. sibling order,
   * tags and comments are not compared.
   */
  bool equals(const CfgNode& other) const;

private:
  std::string _text;
  std::set<std::string> _tags;
  std::set<std::string> _comments;
  int _order_weight;
  bool _has_order_weight;
};

class CfgTree {
public:
  CfgTree();
  ~CfgTree() {}

  CfgNode& getRoot() { return _root; }
  const CfgNode& getRoot() const { return _root; }

  // find or create every node along path. NULL if a component is empty.
  CfgNode *insert(const std::vector<std::string>& path);
  CfgNode *find(const std::vector<std::string>& path) const;

  /* builder interface for the text front end: add a line at "depth" (1 for
   * top-level lines) below the most recently appended line at depth - 1.
   * going deeper by more than one level fails with
   * ERR_MALFORMED_HIERARCHY. deleting nodes while building is not
   * supported.
   */
  CfgNode *appendLine(size_t depth, const std::string& text,
                      hcfg::Error& err, bool force_duplicate = false);
  /* the section that a line appended at "depth" would go into, i.e., the
   * ancestor at depth - 1 on the most recently appended chain.
   */
  CfgNode *getOpenSection(size_t depth) const;

  PreorderRange<CfgNode> allNodes() const {
    return PreorderRange<CfgNode>(&_root);
  }
  size_t size() const { return (_root.subtreeSize() - 1); }
  bool empty() const { return _root.isLeaf(); }

  bool equals(const CfgTree& other) const;
  CfgTree *clone() const;

  static void ancestorPath(const CfgNode& node,
                           std::vector<std::string>& path);

private:
  CfgNode _root;
  CfgNode *_last;

  CfgTree(const CfgTree&);
  CfgTree& operator=(const CfgTree&);
};

} // namespace ctree

#endif /* _CTREE_HPP_ */
