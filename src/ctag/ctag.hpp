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

#ifndef _CTAG_HPP_
#define _CTAG_HPP_
#include <set>
#include <string>

#include <ctree/ctree.hpp>
#include <crule/crule.hpp>

namespace ctag {

/* copy of "tree" in which every node matched by a tag rule has the rule's
 * tags. tags given to a section go to all leaves below it. remediation
 * data is kept, so remediation trees can be tagged as well.
 */
ctree::CfgTree *apply_tags(const ctree::CfgTree& tree,
                           const crule::TagRuleSet& rules);

// add tags to node if it is a leaf, else to every leaf below it
void add_tags(ctree::CfgNode& node, const std::set<std::string>& tags);
// tags of the node and of everything below it
void get_tags(const ctree::CfgNode& node, std::set<std::string>& tags);

/* subset of "tree" with every node that has the tag or has a descendant
 * with the tag, in the original order.
 */
ctree::CfgTree *filter_by_tag(const ctree::CfgTree& tree,
                              const std::string& tag);

/* leaves passing line_inclusion_test() together with their ancestors.
 * an empty include set means "everything not excluded".
 */
ctree::CfgTree *filter_by_tags(const ctree::CfgTree& tree,
                               const std::set<std::string>& include,
                               const std::set<std::string>& exclude);
bool line_inclusion_test(const ctree::CfgNode& leaf,
                         const std::set<std::string>& include,
                         const std::set<std::string>& exclude);

} // namespace ctag

#endif /* _CTAG_HPP_ */
