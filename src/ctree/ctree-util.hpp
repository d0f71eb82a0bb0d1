/*
 * Copyright (C) 2011 Vyatta, Inc.
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

#ifndef _CTREE_UTIL_HPP_
#define _CTREE_UTIL_HPP_
#include <cstddef>
#include <vector>
#include <algorithm>

namespace ctree {

/* a node owns its child nodes (deleted in the destructor). the parent
 * pointer is a back-reference only and never owns anything.
 */
template<class N> class TreeNode {
public:
  typedef N node_type;
  typedef std::vector<N *> nodes_vec_type;
  typedef typename nodes_vec_type::iterator nodes_iter_type;

  TreeNode() : _parent(0) {}
  virtual ~TreeNode() {
    for (nodes_iter_type it = _child_nodes.begin();
         it != _child_nodes.end(); ++it) {
      delete *it;
    }
    _child_nodes.clear();
  }

  size_t numChildNodes() const {
    return _child_nodes.size();
  }
  node_type *getParent() const { return _parent; }
  node_type *childAt(size_t idx) const { return _child_nodes[idx]; }
  void addChildNode(node_type *cnode) {
    _child_nodes.push_back(cnode);
    cnode->_parent = static_cast<node_type *>(this);
  }

  bool removeChildNode(node_type *cnode) {
    nodes_iter_type it = _child_nodes.begin();
    while (it != _child_nodes.end()) {
      if (*it == cnode) {
        _child_nodes.erase(it);
        cnode->_parent = 0;
        return true;
      }
      ++it;
    }
    return false;
  }

  // remove and destroy
  bool deleteChildNode(node_type *cnode) {
    if (!removeChildNode(cnode)) {
      return false;
    }
    delete cnode;
    return true;
  }

  // reorder children. ties keep their current relative order.
  template<class C> void sortChildNodes(C cmp) {
    std::stable_sort(_child_nodes.begin(), _child_nodes.end(), cmp);
  }

private:
  node_type *_parent;
  nodes_vec_type _child_nodes;

  // not copyable (owning raw pointers)
  TreeNode(const TreeNode&);
  TreeNode& operator=(const TreeNode&);
};

/* pre-order walk over the descendants of a node (the node itself is not
 * visited). only a stack of pending nodes is kept, so the walk is lazy.
 */
template<class N> class PreorderIterator {
public:
  PreorderIterator() {}
  explicit PreorderIterator(const N *top) { push_children(top); }

  const N& operator*() const { return *(_pending.back()); }
  const N *operator->() const { return _pending.back(); }

  PreorderIterator& operator++() {
    const N *n = _pending.back();
    _pending.pop_back();
    push_children(n);
    return *this;
  }

  bool operator==(const PreorderIterator& rhs) const {
    return (_pending == rhs._pending);
  }
  bool operator!=(const PreorderIterator& rhs) const {
    return !(*this == rhs);
  }

private:
  std::vector<const N *> _pending;

  void push_children(const N *n) {
    for (size_t i = n->numChildNodes(); i > 0; i--) {
      _pending.push_back(n->childAt(i - 1));
    }
  }
};

// restartable: each begin() starts a new walk
template<class N> class PreorderRange {
public:
  typedef PreorderIterator<N> iterator;

  explicit PreorderRange(const N *top) : _top(top) {}

  iterator begin() const { return iterator(_top); }
  iterator end() const { return iterator(); }

private:
  const N *_top;
};

} // namespace ctree

#endif /* _CTREE_UTIL_HPP_ */
