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

#include <vector>
#include <string>
#include <algorithm>

#include <common/util.hpp>
#include <ctree/ctree.hpp>

using namespace ctree;
using namespace hcfg;
using namespace std;


////// class CfgNode
CfgNode::CfgNode(const string& text)
  : _text(text), _order_weight(0), _has_order_weight(false)
{
}

size_t
CfgNode::depth() const
{
  size_t d = 0;
  for (const CfgNode *p = getParent(); p; p = p->getParent()) {
    ++d;
  }
  return d;
}

void
CfgNode::getPath(vector<string>& path) const
{
  path.clear();
  for (const CfgNode *n = this; n && !n->isRoot(); n = n->getParent()) {
    path.push_back(n->getText());
  }
  reverse(path.begin(), path.end());
}

bool
CfgNode::hasTag(const string& tag) const
{
  return (_tags.find(tag) != _tags.end());
}

CfgNode *
CfgNode::findChild(const string& text, size_t occurrence) const
{
  for (size_t i = 0; i < numChildNodes(); i++) {
    if (childAt(i)->getText() == text) {
      if (occurrence == 0) {
        return childAt(i);
      }
      --occurrence;
    }
  }
  return NULL;
}

size_t
CfgNode::countChildren(const string& text) const
{
  size_t count = 0;
  for (size_t i = 0; i < numChildNodes(); i++) {
    if (childAt(i)->getText() == text) {
      ++count;
    }
  }
  return count;
}

CfgNode *
CfgNode::addChild(const string& text, bool force_duplicate)
{
  if (text.empty()) {
    return NULL;
  }
  if (!force_duplicate) {
    CfgNode *existing = findChild(text);
    if (existing) {
      return existing;
    }
  }
  CfgNode *cn = new CfgNode(text);
  addChildNode(cn);
  return cn;
}

bool
CfgNode::deleteChild(const string& text)
{
  CfgNode *cn = findChild(text);
  return (cn ? deleteChildNode(cn) : false);
}

CfgNode *
CfgNode::copyShallow() const
{
  CfgNode *cn = new CfgNode(_text);
  cn->_tags = _tags;
  cn->_comments = _comments;
  cn->_order_weight = _order_weight;
  cn->_has_order_weight = _has_order_weight;
  cn->copyRemedData(*this);
  return cn;
}

CfgNode *
CfgNode::copyDeep() const
{
  CfgNode *cn = copyShallow();
  for (size_t i = 0; i < numChildNodes(); i++) {
    cn->addChildNode(childAt(i)->copyDeep());
  }
  return cn;
}

size_t
CfgNode::subtreeSize() const
{
  size_t n = 1;
  for (size_t i = 0; i < numChildNodes(); i++) {
    n += childAt(i)->subtreeSize();
  }
  return n;
}

bool
CfgNode::equals(const CfgNode& other) const
{
  if (_text != other._text || numChildNodes() != other.numChildNodes()) {
    return false;
  }

  /* pair up children by text. duplicates (if any) are paired by their
   * occurrence order.
   */
  MapT<string, vector<const CfgNode *> > omap;
  for (size_t i = 0; i < other.numChildNodes(); i++) {
    omap[other.childAt(i)->getText()].push_back(other.childAt(i));
  }
  MapT<string, size_t> seen;
  for (size_t i = 0; i < numChildNodes(); i++) {
    const CfgNode *c = childAt(i);
    MapT<string, vector<const CfgNode *> >::iterator it
      = omap.find(c->getText());
    if (it == omap.end()) {
      return false;
    }
    size_t k = seen[c->getText()]++;
    if (k >= it->second.size() || !c->equals(*(it->second[k]))) {
      return false;
    }
  }
  return true;
}


////// class CfgTree
CfgTree::CfgTree()
  : _root(), _last(NULL)
{
}

CfgNode *
CfgTree::insert(const vector<string>& path)
{
  CfgNode *n = &_root;
  for (size_t i = 0; i < path.size(); i++) {
    n = n->addChild(path[i]);
    if (!n) {
      return NULL;
    }
  }
  return (n == &_root ? NULL : n);
}

CfgNode *
CfgTree::find(const vector<string>& path) const
{
  if (path.empty()) {
    return NULL;
  }
  const CfgNode *n = &_root;
  for (size_t i = 0; i < path.size() && n; i++) {
    n = n->findChild(path[i]);
  }
  return const_cast<CfgNode *>(n);
}

CfgNode *
CfgTree::getOpenSection(size_t depth) const
{
  if (depth == 0) {
    return NULL;
  }
  size_t last_depth = (_last ? _last->depth() : 0);
  if (depth > last_depth + 1) {
    return NULL;
  }
  const CfgNode *p = (_last ? _last : &_root);
  while (p->depth() > depth - 1) {
    p = p->getParent();
  }
  return const_cast<CfgNode *>(p);
}

CfgNode *
CfgTree::appendLine(size_t depth, const string& text, Error& err,
                    bool force_duplicate)
{
  if (text.empty()) {
    err.set(ERR_EMPTY_TEXT, "empty line at depth %zu", depth);
    return NULL;
  }
  CfgNode *parent = getOpenSection(depth);
  if (!parent) {
    size_t last_depth = (_last ? _last->depth() : 0);
    err.set(ERR_MALFORMED_HIERARCHY,
            "line [%s] at depth %zu follows a line at depth %zu",
            text.c_str(), depth, last_depth);
    return NULL;
  }
  _last = parent->addChild(text, force_duplicate);
  return _last;
}

bool
CfgTree::equals(const CfgTree& other) const
{
  return _root.equals(other._root);
}

CfgTree *
CfgTree::clone() const
{
  CfgTree *t = new CfgTree();
  for (size_t i = 0; i < _root.numChildNodes(); i++) {
    t->_root.addChildNode(_root.childAt(i)->copyDeep());
  }
  return t;
}

void
CfgTree::ancestorPath(const CfgNode& node, vector<string>& path)
{
  node.getPath(path);
}
