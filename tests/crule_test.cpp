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
#include <memory>
#include <boost/test/unit_test.hpp>

#include <common/error.hpp>
#include <ctree/ctree.hpp>
#include <crule/crule.hpp>
#include "test_util.hpp"

using namespace crule;
using namespace hcfg;
using namespace std;

static Lineage
lin(const Matcher& m1)
{
  Lineage l;
  l.push_back(m1);
  return l;
}

static Lineage
lin(const Matcher& m1, const Matcher& m2)
{
  Lineage l = lin(m1);
  l.push_back(m2);
  return l;
}

static vector<string>
path(const string& p1, const string& p2 = "")
{
  vector<string> p;
  p.push_back(p1);
  if (!p2.empty()) {
    p.push_back(p2);
  }
  return p;
}

BOOST_AUTO_TEST_SUITE(crule_matcher)

BOOST_AUTO_TEST_CASE(matcher_kinds)
{
  Error err;
  BOOST_CHECK(Matcher::equals("shutdown").matches("shutdown"));
  BOOST_CHECK(!Matcher::equals("shutdown").matches("no shutdown"));
  BOOST_CHECK(Matcher::startswith("interface ").matches("interface Vlan2"));
  BOOST_CHECK(!Matcher::startswith("interface ").matches("interfaces"));
  BOOST_CHECK(Matcher::endswith("banner").matches("motd banner"));
  BOOST_CHECK(!Matcher::endswith("banner").matches("banner motd"));
  BOOST_CHECK(Matcher::contains("secret").matches("enable secret 5 xyz"));
  BOOST_CHECK(!Matcher::contains("secret").matches("enable password x"));

  Matcher re = Matcher::re_search("^ip address \\S+ \\S+$");
  BOOST_CHECK(!re.isCompiled());
  // uncompiled never matches
  BOOST_CHECK(!re.matches("ip address 10.0.0.1 255.0.0.0"));
  BOOST_REQUIRE(re.compile(err));
  BOOST_CHECK(re.matches("ip address 10.0.0.1 255.0.0.0"));
  BOOST_CHECK(!re.matches("ip address 10.0.0.1 255.0.0.0 secondary"));

  // a search, not a full match
  Matcher part = Matcher::re_search("\\d+");
  BOOST_REQUIRE(part.compile(err));
  BOOST_CHECK(part.matches("vlan 10"));
  BOOST_CHECK(!part.matches("vlan"));
}

BOOST_AUTO_TEST_CASE(criteria_and_alternatives)
{
  Error err;
  vector<string> alts;
  alts.push_back("interface ");
  alts.push_back("vlan ");
  Matcher any;
  any.add(MATCH_STARTSWITH, alts);
  BOOST_CHECK(any.matches("interface Vlan2"));
  BOOST_CHECK(any.matches("vlan 2"));
  BOOST_CHECK(!any.matches("hostname r1"));

  Matcher both = Matcher::startswith("interface ");
  both.add(MATCH_RE_SEARCH, "\\d+$");
  BOOST_CHECK_EQUAL(both.numCriteria(), 2u);
  BOOST_REQUIRE(both.compile(err));
  BOOST_CHECK(both.matches("interface Vlan2"));
  BOOST_CHECK(!both.matches("interface Loopback"));
  BOOST_CHECK(!both.matches("vlan 2"));

  Matcher none;
  BOOST_CHECK(!none.matches("x"));
  BOOST_CHECK(!none.compile(err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_INVALID_RULE_PATTERN);
}

BOOST_AUTO_TEST_CASE(bad_regex)
{
  Error err;
  Matcher m = Matcher::re_search("(unclosed");
  BOOST_CHECK(!m.compile(err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_INVALID_RULE_PATTERN);
  BOOST_CHECK(!m.matches("(unclosed"));

  // long patterns are reported in full
  string longpat = "(" + string(600, 'a');
  Matcher big = Matcher::re_search(longpat);
  BOOST_CHECK(!big.compile(err));
  BOOST_CHECK(err.getMessage().find(longpat) != string::npos);
}

BOOST_AUTO_TEST_CASE(kind_names)
{
  MatchKind mk;
  BOOST_REQUIRE(Matcher::parseKind("re_search", mk));
  BOOST_CHECK_EQUAL(mk, MATCH_RE_SEARCH);
  BOOST_CHECK(!Matcher::parseKind("regex", mk));
  BOOST_CHECK_EQUAL(string(Matcher::kindName(MATCH_STARTSWITH)),
                    "startswith");

  RuleKind rk;
  BOOST_REQUIRE(Rule::parseKind("duplicate_child_allowed", rk));
  BOOST_CHECK_EQUAL(rk, RULE_DUPLICATE_CHILD_ALLOWED);
  BOOST_CHECK(!Rule::parseKind("dedup", rk));
  BOOST_CHECK_EQUAL(string(Rule::kindName(RULE_NEGATE_WITH)), "negate_with");
}

BOOST_AUTO_TEST_CASE(lineage_length_must_match)
{
  Lineage l = lin(Matcher::startswith("interface "),
                  Matcher::startswith("description "));
  BOOST_CHECK(lineage_matches(l, path("interface Vlan2", "description x")));
  BOOST_CHECK(!lineage_matches(l, path("interface Vlan2")));
  BOOST_CHECK(!lineage_matches(l, path("vlan 2", "description x")));

  vector<string> deep = path("interface Vlan2", "description x");
  deep.push_back("more");
  BOOST_CHECK(!lineage_matches(l, deep));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(crule_ruleset)

BOOST_AUTO_TEST_CASE(first_match_in_declaration_order)
{
  vector<Rule> rules;
  rules.push_back(Rule::ordering(lin(Matcher::startswith("interface ")), 5));
  rules.push_back(Rule::ordering(lin(Matcher::equals("interface Vlan2")),
                                 50));
  rules.push_back(Rule::idempotent(lin(Matcher::startswith("hostname "))));
  Error err;
  unique_ptr<RuleSet> rs(RuleSet::create(rules, err));
  BOOST_REQUIRE(rs);
  BOOST_CHECK_EQUAL(rs->numRules(RULE_ORDERING), 2u);
  BOOST_CHECK_EQUAL(rs->numRules(RULE_IDEMPOTENT), 1u);
  BOOST_CHECK_EQUAL(rs->numRules(RULE_NEGATE_WITH), 0u);

  const Rule *r = rs->resolvePath(path("interface Vlan2"), RULE_ORDERING);
  BOOST_REQUIRE(r);
  BOOST_CHECK_EQUAL(r->getWeight(), 5);
  BOOST_CHECK(!rs->resolvePath(path("interface Vlan2"), RULE_IDEMPOTENT));
  BOOST_CHECK(!rs->resolvePath(path("vlan 2"), RULE_ORDERING));

  ctree::CfgTree t;
  ctree::CfgNode *n = t.insert(path("hostname r1"));
  r = rs->resolve(*n, RULE_IDEMPOTENT);
  BOOST_REQUIRE(r);
  BOOST_CHECK_EQUAL(r->getKind(), RULE_IDEMPOTENT);
}

BOOST_AUTO_TEST_CASE(invalid_rules)
{
  Error err;
  vector<Rule> rules;
  rules.push_back(Rule::idempotent(lin(Matcher::re_search("[a-"))));
  BOOST_CHECK(!RuleSet::create(rules, err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_INVALID_RULE_PATTERN);

  err.clear();
  rules.clear();
  rules.push_back(Rule::noNegation(Lineage()));
  BOOST_CHECK(!RuleSet::create(rules, err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_INVALID_RULE_PATTERN);

  err.clear();
  vector<TagRule> trules;
  set<string> tags;
  tags.insert("x");
  trules.push_back(TagRule(lin(Matcher::re_search("(")), tags));
  BOOST_CHECK(!TagRuleSet::create(trules, err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_INVALID_RULE_PATTERN);
}

BOOST_AUTO_TEST_CASE(duplicate_child_allowed)
{
  vector<Rule> rules;
  rules.push_back(Rule::duplicateChildAllowed(
                    lin(Matcher::startswith("banner "))));
  Error err;
  unique_ptr<RuleSet> rs(RuleSet::create(rules, err));
  BOOST_REQUIRE(rs);

  ctree::CfgTree t;
  BOOST_CHECK(!rs->duplicateChildAllowed(t.getRoot()));
  BOOST_CHECK(rs->duplicateChildAllowed(*(t.insert(path("banner motd")))));
  BOOST_CHECK(!rs->duplicateChildAllowed(*(t.insert(path("hostname r1")))));
}

BOOST_AUTO_TEST_CASE(negation_with_prefix)
{
  Error err;
  unique_ptr<RuleSet> rs(RuleSet::create(vector<Rule>(), err));
  BOOST_REQUIRE(rs);
  BOOST_CHECK_EQUAL(rs->negate("shutdown"), "no shutdown");
  BOOST_CHECK_EQUAL(rs->negate("no shutdown"), "shutdown");
  BOOST_CHECK_EQUAL(rs->negate("logging event link-status", "default "),
                    "default logging event link-status");
  BOOST_CHECK_EQUAL(rs->negate("no logging event link-status", "default "),
                    "default logging event link-status");
}

BOOST_AUTO_TEST_CASE(negation_with_declaration_prefix)
{
  Error err;
  unique_ptr<RuleSet> rs(get_builtin_driver("juniper_junos", err));
  BOOST_REQUIRE(rs);
  BOOST_CHECK_EQUAL(rs->negate("set system host-name r1"),
                    "delete system host-name r1");
  BOOST_CHECK_EQUAL(rs->negate("delete system host-name r1"),
                    "set system host-name r1");
  BOOST_CHECK_EQUAL(rs->negate("system host-name r1"),
                    "delete system host-name r1");
}

BOOST_AUTO_TEST_SUITE_END()
