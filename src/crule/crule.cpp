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
#include <regex>

#include <common/util.hpp>
#include <ctree/ctree.hpp>
#include <crule/crule.hpp>

using namespace crule;
using namespace hcfg;
using namespace std;

static const char *match_kind_names[] = {
  "equals", "startswith", "endswith", "contains", "re_search", NULL
};

static const char *rule_kind_names[] = {
  "default_negation", "negate_with", "idempotent", "sectional_exiting",
  "ordering", "no_negation", "duplicate_child_allowed", NULL
};

static bool
compile_lineage(Lineage& lineage, Error& err)
{
  if (lineage.empty()) {
    err.set(ERR_INVALID_RULE_PATTERN, "rule has an empty lineage");
    return false;
  }
  for (size_t i = 0; i < lineage.size(); i++) {
    if (!lineage[i].compile(err)) {
      return false;
    }
  }
  return true;
}


////// class Matcher
Matcher&
Matcher::add(MatchKind kind, const string& pattern)
{
  return add(kind, vector<string>(1, pattern));
}

Matcher&
Matcher::add(MatchKind kind, const vector<string>& alternatives)
{
  Criterion c;
  c.kind = kind;
  c.patterns = alternatives;
  _criteria.push_back(c);
  _compiled = false;
  return *this;
}

bool
Matcher::compile(Error& err)
{
  if (_criteria.empty()) {
    err.set(ERR_INVALID_RULE_PATTERN, "lineage level has no criteria");
    return false;
  }
  for (size_t i = 0; i < _criteria.size(); i++) {
    Criterion& c = _criteria[i];
    if (c.patterns.empty()) {
      err.set(ERR_INVALID_RULE_PATTERN, "%s criterion has no alternatives",
              kindName(c.kind));
      return false;
    }
    c.res.clear();
    if (c.kind != MATCH_RE_SEARCH) {
      continue;
    }
    for (size_t j = 0; j < c.patterns.size(); j++) {
      try {
        c.res.push_back(shared_ptr<regex>(new regex(c.patterns[j],
                                                    regex::ECMAScript)));
      } catch (const regex_error& e) {
        c.res.clear();
        _compiled = false;
        err.set(ERR_INVALID_RULE_PATTERN, "invalid pattern [%s]: %s",
                c.patterns[j].c_str(), e.what());
        return false;
      }
    }
  }
  _compiled = true;
  return true;
}

bool
Matcher::critMatches(const Criterion& c, const string& text)
{
  for (size_t i = 0; i < c.patterns.size(); i++) {
    const string& p = c.patterns[i];
    bool m = false;
    switch (c.kind) {
    case MATCH_EQUALS:
      m = (text == p);
      break;
    case MATCH_STARTSWITH:
      m = str_startswith(text, p);
      break;
    case MATCH_ENDSWITH:
      m = str_endswith(text, p);
      break;
    case MATCH_CONTAINS:
      m = (text.find(p) != string::npos);
      break;
    case MATCH_RE_SEARCH:
      m = (i < c.res.size() && regex_search(text, *(c.res[i])));
      break;
    }
    if (m) {
      return true;
    }
  }
  return false;
}

bool
Matcher::matches(const string& text) const
{
  if (_criteria.empty()) {
    return false;
  }
  for (size_t i = 0; i < _criteria.size(); i++) {
    if (!critMatches(_criteria[i], text)) {
      return false;
    }
  }
  return true;
}

const char *
Matcher::kindName(MatchKind kind)
{
  return match_kind_names[kind];
}

bool
Matcher::parseKind(const string& name, MatchKind& kind)
{
  for (size_t i = 0; match_kind_names[i]; i++) {
    if (name == match_kind_names[i]) {
      kind = static_cast<MatchKind>(i);
      return true;
    }
  }
  return false;
}

bool
crule::lineage_matches(const Lineage& lineage, const vector<string>& path)
{
  if (lineage.size() != path.size()) {
    return false;
  }
  for (size_t i = 0; i < lineage.size(); i++) {
    if (!lineage[i].matches(path[i])) {
      return false;
    }
  }
  return true;
}


////// class Rule
const char *
Rule::kindName(RuleKind kind)
{
  return (kind < RULE_KIND_COUNT ? rule_kind_names[kind] : "unknown");
}

bool
Rule::parseKind(const string& name, RuleKind& kind)
{
  for (size_t i = 0; rule_kind_names[i]; i++) {
    if (name == rule_kind_names[i]) {
      kind = static_cast<RuleKind>(i);
      return true;
    }
  }
  return false;
}


////// class RuleSet
RuleSet *
RuleSet::create(const vector<Rule>& rules, Error& err,
                const DriverOptions& opts)
{
  RuleSet *rs = new RuleSet();
  rs->_opts = opts;
  rs->_rules = rules;
  for (size_t i = 0; i < rs->_rules.size(); i++) {
    Rule& r = rs->_rules[i];
    if (!compile_lineage(r._lineage, err)) {
      delete rs;
      return NULL;
    }
    rs->_kind_idx[r._kind].push_back(i);
  }
  return rs;
}

const Rule *
RuleSet::resolvePath(const vector<string>& path, RuleKind kind) const
{
  const vector<size_t>& idx = _kind_idx[kind];
  for (size_t i = 0; i < idx.size(); i++) {
    if (_rules[idx[i]].matches(path)) {
      return &(_rules[idx[i]]);
    }
  }
  return NULL;
}

const Rule *
RuleSet::resolve(const ctree::CfgNode& node, RuleKind kind) const
{
  if (_kind_idx[kind].empty()) {
    return NULL;
  }
  vector<string> path;
  node.getPath(path);
  return resolvePath(path, kind);
}

bool
RuleSet::duplicateChildAllowed(const ctree::CfgNode& parent) const
{
  if (parent.isRoot()) {
    // no rule has an empty lineage
    return false;
  }
  return (resolve(parent, RULE_DUPLICATE_CHILD_ALLOWED) != NULL);
}

string
RuleSet::negate(const string& text, const string& token) const
{
  const string& nprefix = _opts.negation_prefix;
  const string& dprefix = _opts.declaration_prefix;
  const string& tok = (token.empty() ? nprefix : token);

  if (!dprefix.empty()) {
    // "set X" <-> "delete X"
    if (str_startswith(text, dprefix)) {
      return (tok + text.substr(dprefix.size()));
    }
    if (str_startswith(text, tok)) {
      return (dprefix + text.substr(tok.size()));
    }
    return (tok + text);
  }

  if (tok == nprefix) {
    if (str_startswith(text, nprefix)) {
      return text.substr(nprefix.size());
    }
    return (nprefix + text);
  }

  // e.g., "default X" for both "X" and "no X"
  if (!nprefix.empty() && str_startswith(text, nprefix)) {
    return (tok + text.substr(nprefix.size()));
  }
  return (tok + text);
}


////// class TagRuleSet
TagRuleSet *
TagRuleSet::create(const vector<TagRule>& rules, Error& err)
{
  TagRuleSet *ts = new TagRuleSet();
  ts->_rules = rules;
  for (size_t i = 0; i < ts->_rules.size(); i++) {
    if (!compile_lineage(ts->_rules[i]._lineage, err)) {
      delete ts;
      return NULL;
    }
  }
  return ts;
}
