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

#ifndef _CRULE_HPP_
#define _CRULE_HPP_
#include <vector>
#include <string>
#include <set>
#include <memory>
#include <regex>

#include <common/error.hpp>

// forward decl
namespace ctree {
class CfgNode;
}

namespace crule {

enum MatchKind {
  MATCH_EQUALS,
  MATCH_STARTSWITH,
  MATCH_ENDSWITH,
  MATCH_CONTAINS,
  MATCH_RE_SEARCH
};

/* test applied to the text of one level of an ancestor path. a matcher
 * holds one or more criteria and accepts a text only if every criterion
 * does. a criterion accepts a text if any of its alternatives does.
 */
class Matcher {
public:
  Matcher() : _compiled(false) {}
  Matcher(MatchKind kind, const std::string& pattern) : _compiled(false) {
    add(kind, pattern);
  }

  static Matcher equals(const std::string& s) {
    return Matcher(MATCH_EQUALS, s);
  }
  static Matcher startswith(const std::string& s) {
    return Matcher(MATCH_STARTSWITH, s);
  }
  static Matcher endswith(const std::string& s) {
    return Matcher(MATCH_ENDSWITH, s);
  }
  static Matcher contains(const std::string& s) {
    return Matcher(MATCH_CONTAINS, s);
  }
  static Matcher re_search(const std::string& s) {
    return Matcher(MATCH_RE_SEARCH, s);
  }

  Matcher& add(MatchKind kind, const std::string& pattern);
  Matcher& add(MatchKind kind, const std::vector<std::string>& alternatives);

  size_t numCriteria() const { return _criteria.size(); }
  bool isCompiled() const { return _compiled; }

  /* prepare the matcher. fails on a bad regular expression or a matcher
   * without criteria.
   */
  bool compile(hcfg::Error& err);
  // a matcher with a re_search criterion that has not been compiled never
  // matches
  bool matches(const std::string& text) const;

  static const char *kindName(MatchKind kind);
  // false if "name" is not one of the matcher key names
  static bool parseKind(const std::string& name, MatchKind& kind);

private:
  struct Criterion {
    MatchKind kind;
    std::vector<std::string> patterns;
    std::vector<std::shared_ptr<std::regex> > res;
  };

  std::vector<Criterion> _criteria;
  bool _compiled;

  static bool critMatches(const Criterion& c, const std::string& text);
};

typedef std::vector<Matcher> Lineage;

/* true if path has exactly as many levels as the lineage and every matcher
 * accepts the text at its level.
 */
bool lineage_matches(const Lineage& lineage,
                     const std::vector<std::string>& path);

enum RuleKind {
  RULE_DEFAULT_NEGATION,
  RULE_NEGATE_WITH,
  RULE_IDEMPOTENT,
  RULE_SECTIONAL_EXITING,
  RULE_ORDERING,
  RULE_NO_NEGATION,
  RULE_DUPLICATE_CHILD_ALLOWED,
  RULE_KIND_COUNT
};

/* immutable once constructed. each kind only uses its own parameter:
 *   default_negation: negation token
 *   negate_with: replacement text
 *   sectional_exiting: exit text
 *   ordering: weight
 */
class Rule {
public:
  static Rule defaultNegation(const Lineage& l, const std::string& token) {
    Rule r(RULE_DEFAULT_NEGATION, l);
    r._text = token;
    return r;
  }
  static Rule negateWith(const Lineage& l, const std::string& replacement) {
    Rule r(RULE_NEGATE_WITH, l);
    r._text = replacement;
    return r;
  }
  static Rule idempotent(const Lineage& l) {
    return Rule(RULE_IDEMPOTENT, l);
  }
  static Rule sectionalExiting(const Lineage& l,
                               const std::string& exit_text) {
    Rule r(RULE_SECTIONAL_EXITING, l);
    r._text = exit_text;
    return r;
  }
  static Rule ordering(const Lineage& l, int weight) {
    Rule r(RULE_ORDERING, l);
    r._weight = weight;
    return r;
  }
  static Rule noNegation(const Lineage& l) {
    return Rule(RULE_NO_NEGATION, l);
  }
  static Rule duplicateChildAllowed(const Lineage& l) {
    return Rule(RULE_DUPLICATE_CHILD_ALLOWED, l);
  }

  RuleKind getKind() const { return _kind; }
  const Lineage& getLineage() const { return _lineage; }
  const std::string& getNegationToken() const { return _text; }
  const std::string& getReplacement() const { return _text; }
  const std::string& getExitText() const { return _text; }
  int getWeight() const { return _weight; }

  bool matches(const std::vector<std::string>& path) const {
    return lineage_matches(_lineage, path);
  }

  static const char *kindName(RuleKind kind);
  static bool parseKind(const std::string& name, RuleKind& kind);

private:
  friend class RuleSet;

  Rule(RuleKind kind, const Lineage& l)
    : _kind(kind), _lineage(l), _weight(0) {}

  RuleKind _kind;
  Lineage _lineage;
  std::string _text;
  int _weight;
};

struct DriverOptions {
  DriverOptions()
    : negation_prefix("no "), indentation(1) {}

  std::string platform;
  std::string negation_prefix;
  // prefix of every declared line, e.g., "set " for junos-style configs
  std::string declaration_prefix;
  size_t indentation;
};

class RuleSet {
public:
  /* compile all matchers. returns NULL (with ERR_INVALID_RULE_PATTERN) if
   * a pattern does not compile or a rule has an empty lineage. the caller
   * owns the result.
   */
  static RuleSet *create(const std::vector<Rule>& rules, hcfg::Error& err,
                         const DriverOptions& opts = DriverOptions());
  ~RuleSet() {}

  /* first rule of this kind, in declaration order, matching the ancestor
   * path of the node. NULL if none.
   */
  const Rule *resolve(const ctree::CfgNode& node, RuleKind kind) const;
  const Rule *resolvePath(const std::vector<std::string>& path,
                          RuleKind kind) const;

  // whether children of "parent" may repeat the same text
  bool duplicateChildAllowed(const ctree::CfgNode& parent) const;

  /* text that removes the line "text". "token" is the negation token to
   * use (the driver negation prefix if empty). a line that already is a
   * negation is restored by stripping the negation prefix.
   */
  std::string negate(const std::string& text,
                     const std::string& token = "") const;

  const std::vector<Rule>& getRules() const { return _rules; }
  const DriverOptions& getOptions() const { return _opts; }
  size_t numRules(RuleKind kind) const { return _kind_idx[kind].size(); }

private:
  std::vector<Rule> _rules;
  std::vector<size_t> _kind_idx[RULE_KIND_COUNT];
  DriverOptions _opts;

  RuleSet() {}
  RuleSet(const RuleSet&);
  RuleSet& operator=(const RuleSet&);
};

class TagRule {
public:
  TagRule(const Lineage& l, const std::set<std::string>& tags)
    : _lineage(l), _tags(tags) {}

  const Lineage& getLineage() const { return _lineage; }
  const std::set<std::string>& getTags() const { return _tags; }
  bool matches(const std::vector<std::string>& path) const {
    return lineage_matches(_lineage, path);
  }

private:
  friend class TagRuleSet;

  Lineage _lineage;
  std::set<std::string> _tags;
};

class TagRuleSet {
public:
  static TagRuleSet *create(const std::vector<TagRule>& rules,
                            hcfg::Error& err);
  ~TagRuleSet() {}

  const std::vector<TagRule>& getRules() const { return _rules; }

private:
  std::vector<TagRule> _rules;

  TagRuleSet() {}
  TagRuleSet(const TagRuleSet&);
  TagRuleSet& operator=(const TagRuleSet&);
};

} // namespace crule

#endif /* _CRULE_HPP_ */
