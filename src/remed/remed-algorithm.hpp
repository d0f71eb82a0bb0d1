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

#ifndef _REMED_ALGORITHM_HPP_
#define _REMED_ALGORITHM_HPP_
#include <vector>
#include <string>

#include <common/error.hpp>
#include <ctree/ctree.hpp>
#include <crule/crule.hpp>
#include <remed/remed-data.hpp>

namespace remed {

/* remediation that turns "running" into "target". removals come first (in
 * running order), then additions and the sections leading to nested
 * changes (in target order); each level is then stably sorted by ordering
 * weight. "diags", if given, receives one ERR_AMBIGUOUS_IDEMPOTENT_MATCH
 * per idempotent slot that could not be paired. never fails. the caller
 * owns the result.
 */
ctree::CfgTree *compare(const ctree::CfgTree& running,
                        const ctree::CfgTree& target,
                        const crule::RuleSet& rules,
                        std::vector<hcfg::Error> *diags = NULL);

/* the config that results from applying "remediation" to "running".
 * changed sections come first in remediation order, followed by the
 * untouched running lines in their original order. "running" is not
 * modified.
 */
ctree::CfgTree *predict(const ctree::CfgTree& running,
                        const ctree::CfgTree& remediation);
ctree::CfgTree *predict_from_target(const ctree::CfgTree& running,
                                    const ctree::CfgTree& target,
                                    const crule::RuleSet& rules);

// remediation that undoes the change from "running" to "future"
ctree::CfgTree *rollback(const ctree::CfgTree& future,
                         const ctree::CfgTree& running,
                         const crule::RuleSet& rules,
                         std::vector<hcfg::Error> *diags = NULL);

/* apply each target in turn, starting from "running". the remediation of
 * every step is appended to "remediations" (caller owns them) and the
 * predicted config after the last step is returned.
 */
ctree::CfgTree *predict_steps(const ctree::CfgTree& running,
                              const std::vector<const ctree::CfgTree *>&
                                targets,
                              const crule::RuleSet& rules,
                              std::vector<ctree::CfgTree *>& remediations);

/* the lines of "cfg1" that are not in "cfg2". entries of ip/ipv4/ipv6
 * access lists are compared without their sequence numbers. negated and
 * "default " lines of "cfg1" are skipped.
 */
ctree::CfgTree *difference(const ctree::CfgTree& cfg1,
                           const ctree::CfgTree& cfg2,
                           const crule::RuleSet& rules);

// number of remediation nodes with this op (exit markers not counted)
size_t count_remed_ops(const ctree::CfgTree& remediation, RemedOp op);

} // namespace remed

#endif /* _REMED_ALGORITHM_HPP_ */
