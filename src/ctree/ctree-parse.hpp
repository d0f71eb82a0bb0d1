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

#ifndef _CTREE_PARSE_HPP_
#define _CTREE_PARSE_HPP_
#include <vector>
#include <string>

#include <common/error.hpp>
#include <ctree/ctree.hpp>

// forward decl
namespace crule {
class RuleSet;
}

namespace ctree {

/* flatten curly-brace text ("system {", "    host-name r1;", "}") into
 * declaration lines ("set system host-name r1"). the block level is taken
 * from the indentation, four spaces per level. lines that already carry the
 * declaration or negation prefix are kept as they are.
 */
void convert_to_set_commands(const std::vector<std::string>& lines,
                             std::vector<std::string>& commands,
                             const std::string& declaration = "set ",
                             const std::string& negation = "delete ");

/* build a tree from indented vendor text. a line is a child of the closest
 * preceding line with less indentation. blank lines, "!" lines and "end"
 * are skipped. if "rules" is given, exit lines of sectional_exiting
 * sections are dropped and duplicate_child_allowed sections keep repeated
 * lines. with a driver that has a declaration prefix, curly-brace text is
 * flattened by convert_to_set_commands first. returns NULL with err set on failure; the caller owns the tree.
 */
CfgTree *parse_lines(const std::vector<std::string>& lines,
                     const crule::RuleSet *rules, hcfg::Error& err);
CfgTree *parse_text(const std::string& text, const crule::RuleSet *rules,
                    hcfg::Error& err);
// unreadable files give ERR_CONFIG_FILE
CfgTree *parse_file(const std::string& path, const crule::RuleSet *rules,
                    hcfg::Error& err);

void split_lines(const std::string& text, std::vector<std::string>& lines);

} // namespace ctree

#endif /* _CTREE_PARSE_HPP_ */
