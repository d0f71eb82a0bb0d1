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
#include <set>

#include <ctree/ctree.hpp>
#include <crule/crule.hpp>
#include <ctag/ctag.hpp>

using namespace ctag;
using namespace ctree;
using namespace crule;
using namespace std;

static bool
_intersects(const set<string>& s1, const set<string>& s2)
{
  for (set<string>::const_iterator it = s1.begin(); it != s1.end(); ++it) {
    if (s2.find(*it) != s2.end()) {
      return true;
    }
  }
  return false;
}

static void
_apply_tags(CfgNode& node, const TagRuleSet& rules, vector<string>& path)
{
  if (!node.isRoot()) {
    path.push_back(node.getText());
    const vector<TagRule>& trs = rules.getRules();
    for (size_t i = 0; i < trs.size(); i++) {
      if (trs[i].matches(path)) {
        add_tags(node, trs[i].getTags());
      }
    }
  }
  for (size_t i = 0; i < node.numChildNodes(); i++) {
    _apply_tags(*(node.childAt(i)), rules, path);
  }
  if (!node.isRoot()) {
    path.pop_back();
  }
}

static bool
_has_tag_below(const CfgNode& node, const string& tag)
{
  if (node.hasTag(tag)) {
    return true;
  }
  for (size_t i = 0; i < node.numChildNodes(); i++) {
    if (_has_tag_below(*(node.childAt(i)), tag)) {
      return true;
    }
  }
  return false;
}

static void
_filter_by_tag(const CfgNode& src, CfgNode& dst, const string& tag)
{
  for (size_t i = 0; i < src.numChildNodes(); i++) {
    const CfgNode *c = src.childAt(i);
    if (_has_tag_below(*c, tag)) {
      CfgNode *fc = c->copyShallow();
      dst.addChildNode(fc);
      _filter_by_tag(*c, *fc, tag);
    }
  }
}

static void
_filter_by_tags(const CfgNode& src, CfgNode& dst, const set<string>& include,
                const set<string>& exclude)
{
  for (size_t i = 0; i < src.numChildNodes(); i++) {
    const CfgNode *c = src.childAt(i);
    if (c->isLeaf()) {
      if (line_inclusion_test(*c, include, exclude)) {
        dst.addChildNode(c->copyShallow());
      }
      continue;
    }
    CfgNode *fc = c->copyShallow();
    dst.addChildNode(fc);
    _filter_by_tags(*c, *fc, include, exclude);
    if (fc->isLeaf()) {
      // nothing below survived
      dst.deleteChildNode(fc);
    }
  }
}

void
ctag::add_tags(CfgNode& node, const set<string>& tags)
{
  if (node.isLeaf()) {
    for (set<string>::const_iterator it = tags.begin(); it != tags.end();
         ++it) {
      node.addTag(*it);
    }
    return;
  }
  for (size_t i = 0; i < node.numChildNodes(); i++) {
    add_tags(*(node.childAt(i)), tags);
  }
}

void
ctag::get_tags(const CfgNode& node, set<string>& tags)
{
  tags.insert(node.getTags().begin(), node.getTags().end());
  for (size_t i = 0; i < node.numChildNodes(); i++) {
    get_tags(*(node.childAt(i)), tags);
  }
}

CfgTree *
ctag::apply_tags(const CfgTree& tree, const TagRuleSet& rules)
{
  CfgTree *tagged = tree.clone();
  vector<string> path;
  _apply_tags(tagged->getRoot(), rules, path);
  return tagged;
}

CfgTree *
ctag::filter_by_tag(const CfgTree& tree, const string& tag)
{
  CfgTree *filtered = new CfgTree();
  _filter_by_tag(tree.getRoot(), filtered->getRoot(), tag);
  return filtered;
}

CfgTree *
ctag::filter_by_tags(const CfgTree& tree, const set<string>& include,
                     const set<string>& exclude)
{
  CfgTree *filtered = new CfgTree();
  _filter_by_tags(tree.getRoot(), filtered->getRoot(), include, exclude);
  return filtered;
}

bool
ctag::line_inclusion_test(const CfgNode& leaf, const set<string>& include,
                          const set<string>& exclude)
{
  set<string> tags;
  get_tags(leaf, tags);
  bool include_line = false;
  if (!include.empty()) {
    include_line = _intersects(tags, include);
  }
  if (!exclude.empty() && (include_line || include.empty())) {
    return !_intersects(tags, exclude);
  }
  return include_line;
}
