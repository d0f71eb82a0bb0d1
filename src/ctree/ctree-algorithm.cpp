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

#include <common/output.hpp>
#include <ctree/ctree.hpp>
#include <ctree/ctree-algorithm.hpp>

using namespace ctree;
using namespace hcfg;
using namespace std;

////// constants
static const string PFX_DIFF_ADD = "+ "; // added
static const string PFX_DIFF_DEL = "- "; // deleted
static const string PFX_DIFF_NONE = "";


////// static (internal) functions
static string
_indent_str(size_t level, size_t indentation)
{
  return string((level > 0 ? (level - 1) * indentation : 0), ' ');
}

static string
_line_str(const CfgNode& node, size_t indentation, bool with_comments)
{
  string line = _indent_str(node.depth(), indentation) + node.getText();
  if (with_comments && !node.getComments().empty()) {
    const set<string>& cs = node.getComments();
    string sep = " !";
    for (set<string>::const_iterator it = cs.begin(); it != cs.end(); ++it) {
      line += sep;
      line += *it;
      sep = ", ";
    }
  }
  return line;
}

static void
_get_subtree_lines(const CfgNode& node, const string& pfx,
                   size_t indentation, vector<string>& lines)
{
  lines.push_back(_indent_str(node.depth(), indentation) + pfx
                  + node.getText());
  for (size_t i = 0; i < node.numChildNodes(); i++) {
    _get_subtree_lines(*(node.childAt(i)), pfx, indentation, lines);
  }
}

// returns whether anything differs below (and including) this level
static bool
_get_diff(const CfgNode& cfg1, const CfgNode& cfg2, size_t indentation,
          vector<string>& lines)
{
  size_t start = lines.size();
  for (size_t i = 0; i < cfg1.numChildNodes(); i++) {
    const CfgNode *c1 = cfg1.childAt(i);
    const CfgNode *c2 = cfg2.findChild(c1->getText());
    if (!c2) {
      _get_subtree_lines(*c1, PFX_DIFF_DEL, indentation, lines);
      continue;
    }
    vector<string> sub;
    if (_get_diff(*c1, *c2, indentation, sub)) {
      lines.push_back(_indent_str(c1->depth(), indentation) + PFX_DIFF_NONE
                      + c1->getText());
      lines.insert(lines.end(), sub.begin(), sub.end());
    }
  }
  for (size_t i = 0; i < cfg2.numChildNodes(); i++) {
    const CfgNode *c2 = cfg2.childAt(i);
    if (!cfg1.findChild(c2->getText())) {
      _get_subtree_lines(*c2, PFX_DIFF_ADD, indentation, lines);
    }
  }
  return (lines.size() > start);
}


////// algorithms
void
ctree::get_lines(const CfgTree& tree, vector<string>& lines,
                 size_t indentation, bool with_comments)
{
  PreorderRange<CfgNode> nodes = tree.allNodes();
  for (PreorderRange<CfgNode>::iterator it = nodes.begin();
       it != nodes.end(); ++it) {
    lines.push_back(_line_str(*it, indentation, with_comments));
  }
}

string
ctree::dump_text(const CfgTree& tree, size_t indentation, bool with_comments)
{
  vector<string> lines;
  get_lines(tree, lines, indentation, with_comments);
  string text;
  for (size_t i = 0; i < lines.size(); i++) {
    text += lines[i];
    text += "\n";
  }
  return text;
}

void
ctree::show_tree(const CfgTree& tree, size_t indentation, bool with_comments)
{
  vector<string> lines;
  get_lines(tree, lines, indentation, with_comments);
  for (size_t i = 0; i < lines.size(); i++) {
    output_user("%s\n", lines[i].c_str());
  }
}

void
ctree::get_unified_diff(const CfgTree& cfg1, const CfgTree& cfg2,
                        vector<string>& lines, size_t indentation)
{
  _get_diff(cfg1.getRoot(), cfg2.getRoot(), indentation, lines);
}

void
ctree::show_tree_diff(const CfgTree& cfg1, const CfgTree& cfg2,
                      size_t indentation)
{
  vector<string> lines;
  get_unified_diff(cfg1, cfg2, lines, indentation);
  for (size_t i = 0; i < lines.size(); i++) {
    output_user("%s\n", lines[i].c_str());
  }
}
