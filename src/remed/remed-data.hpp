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

#ifndef _REMED_DATA_HPP_
#define _REMED_DATA_HPP_
#include <vector>
#include <string>

// forward decl
namespace ctree {
class CfgNode;
}

namespace remed {

enum RemedOp {
  REMED_NONE,
  REMED_ADD,
  REMED_REMOVE
};

/* per-node data that only matters for nodes of a remediation tree. nodes
 * of ordinary config trees have op REMED_NONE.
 */
class RemedData {
public:
  RemedData();
  virtual ~RemedData() {}

  // setters
  void setRemedOp(RemedOp op);
  void setRemedOrigin(const ctree::CfgNode *origin);
  void addSourceText(const std::string& text);
  void setSupersededText(const std::string& text);
  void setNewInConfig(bool nic);
  void setSectionalExit(bool se);
  void setForceDuplicate(bool fd);
  void copyRemedData(const RemedData& other);
  void clearRemedData();

  // getters
  RemedOp getRemedOp() const;
  /* the node in the running or target tree this node was generated from.
   * only for diagnostics: the origin tree may already be gone.
   */
  const ctree::CfgNode *getRemedOrigin() const;
  /* texts of the running lines a "remove" acts on. several lines can share
   * one negation, e.g., a negate_with rule matching more than one sibling.
   */
  const std::vector<std::string>& getSourceTexts() const;
  // text of the running line an idempotent "add" replaces
  const std::string& getSupersededText() const;
  bool supersedes() const;
  bool isNewInConfig() const;
  bool isSectionalExit() const;
  bool isForceDuplicate() const;

private:
  RemedOp _remed_op;
  const ctree::CfgNode *_remed_origin;
  std::vector<std::string> _source_texts;
  std::string _superseded_text;
  bool _new_in_config;
  bool _sectional_exit;
  bool _force_duplicate;
};

} // namespace remed

#endif /* _REMED_DATA_HPP_ */
