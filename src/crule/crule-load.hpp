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

#ifndef _CRULE_LOAD_HPP_
#define _CRULE_LOAD_HPP_
#include <vector>
#include <string>

#include <common/error.hpp>
#include <crule/crule.hpp>

namespace crule {

/* driver (rule set) documents. the caller owns the returned object. on
 * failure NULL is returned and err is set to ERR_DRIVER_FILE (bad file or
 * document) or ERR_INVALID_RULE_PATTERN (a matcher does not compile).
 */
RuleSet *load_driver_text(const std::string& yaml, hcfg::Error& err);
RuleSet *load_driver_file(const std::string& path, hcfg::Error& err);

// tag rule documents, same conventions as above
TagRuleSet *load_tags_text(const std::string& yaml, hcfg::Error& err);
TagRuleSet *load_tags_file(const std::string& path, hcfg::Error& err);

// drivers compiled into the library: "generic", "cisco_ios", "juniper_junos"
RuleSet *get_builtin_driver(const std::string& platform, hcfg::Error& err);
void get_builtin_platforms(std::vector<std::string>& names);

} // namespace crule

#endif /* _CRULE_LOAD_HPP_ */
