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

#ifndef _CTREE_ALGORITHM_HPP_
#define _CTREE_ALGORITHM_HPP_

#include <vector>
#include <string>

#include <ctree/ctree.hpp>

namespace ctree {

/* render the tree as vendor text, one line per node in pre-order. each
 * level is indented by "indentation" spaces. with_comments appends the
 * node comments as " !c1, c2".
 */
void get_lines(const CfgTree& tree, std::vector<std::string>& lines,
               size_t indentation = 1, bool with_comments = false);
std::string dump_text(const CfgTree& tree, size_t indentation = 1,
                      bool with_comments = false);
void show_tree(const CfgTree& tree, size_t indentation = 1,
               bool with_comments = false);

/* "-" lines only in cfg1, "+" lines only in cfg2. a section present in
 * both is shown (without prefix) only if something below it differs.
 */
void get_unified_diff(const CfgTree& cfg1, const CfgTree& cfg2,
                      std::vector<std::string>& lines,
                      size_t indentation = 1);
void show_tree_diff(const CfgTree& cfg1, const CfgTree& cfg2,
                    size_t indentation = 1);

} // namespace ctree

#endif /* _CTREE_ALGORITHM_HPP_ */
