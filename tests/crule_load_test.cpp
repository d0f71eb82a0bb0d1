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
#include <crule/crule.hpp>
#include <crule/crule-load.hpp>
#include "test_util.hpp"

using namespace crule;
using namespace hcfg;
using namespace std;

static void
check_driver_error(const string& yaml, ErrorKind kind)
{
  Error err;
  unique_ptr<RuleSet> rs(load_driver_text(yaml, err));
  BOOST_CHECK_MESSAGE(!rs, "driver loaded: " << yaml);
  BOOST_CHECK_EQUAL(err.getKind(), kind);
}

BOOST_AUTO_TEST_SUITE(crule_load)

BOOST_AUTO_TEST_CASE(full_driver_file)
{
  Error err;
  unique_ptr<RuleSet> rs(load_driver_file(
                           hcfg_test::data_path("full_driver.yaml"), err));
  BOOST_REQUIRE_MESSAGE(rs, err.to_string());

  const DriverOptions& opts = rs->getOptions();
  BOOST_CHECK_EQUAL(opts.platform, "cisco_ios");
  BOOST_CHECK_EQUAL(opts.negation_prefix, "no ");
  BOOST_CHECK_EQUAL(opts.declaration_prefix, "");
  BOOST_CHECK_EQUAL(opts.indentation, 2u);

  BOOST_CHECK_EQUAL(rs->getRules().size(), 7u);
  for (int k = 0; k < RULE_KIND_COUNT; k++) {
    BOOST_CHECK_EQUAL(rs->numRules(static_cast<RuleKind>(k)), 1u);
  }

  vector<string> p;
  p.push_back("logging console");
  const Rule *r = rs->resolvePath(p, RULE_NEGATE_WITH);
  BOOST_REQUIRE(r);
  BOOST_CHECK_EQUAL(r->getReplacement(), "logging console debugging");

  p[0] = "router bgp 65000";
  r = rs->resolvePath(p, RULE_SECTIONAL_EXITING);
  BOOST_REQUIRE(r);
  BOOST_CHECK_EQUAL(r->getExitText(), "exit");

  p[0] = "no vlan 10";
  r = rs->resolvePath(p, RULE_ORDERING);
  BOOST_REQUIRE(r);
  BOOST_CHECK_EQUAL(r->getWeight(), 200);

  p[0] = "logging event link-status";
  r = rs->resolvePath(p, RULE_DEFAULT_NEGATION);
  BOOST_REQUIRE(r);
  BOOST_CHECK_EQUAL(r->getNegationToken(), "default ");

  p[0] = "enable secret 5 abc";
  BOOST_CHECK(rs->resolvePath(p, RULE_NO_NEGATION));
  p[0] = "motd banner";
  BOOST_CHECK(rs->resolvePath(p, RULE_DUPLICATE_CHILD_ALLOWED));
}

BOOST_AUTO_TEST_CASE(defaults)
{
  unique_ptr<RuleSet> rs(hcfg_test::driver("rules: []\n"));
  BOOST_CHECK_EQUAL(rs->getOptions().negation_prefix, "no ");
  BOOST_CHECK_EQUAL(rs->getOptions().indentation, 1u);
  BOOST_CHECK(rs->getRules().empty());

  // an empty document is an empty driver
  unique_ptr<RuleSet> empty(hcfg_test::driver("{}"));
  BOOST_CHECK(empty->getRules().empty());
}

BOOST_AUTO_TEST_CASE(malformed_documents)
{
  check_driver_error("rules: [ unclosed", ERR_DRIVER_FILE);
  check_driver_error("- just\n- a list\n", ERR_DRIVER_FILE);
  check_driver_error("rules: { kind: idempotent }\n", ERR_DRIVER_FILE);
  check_driver_error("indentation: 0\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: dedup\n"
                     "    lineage: [ { equals: x } ]\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: negate_with\n"
                     "    lineage: [ { equals: x } ]\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: sectional_exiting\n"
                     "    lineage: [ { equals: x } ]\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: ordering\n"
                     "    lineage: [ { equals: x } ]\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: idempotent\n"
                     "    lineage: []\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: idempotent\n"
                     "    lineage: [ { like: x } ]\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: idempotent\n"
                     "    lineage: [ { } ]\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: idempotent\n"
                     "    lineage: [ { startswith: [] } ]\n", ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: idempotent\n"
                     "    lineage: [ { startswith: [ [ x ] ] } ]\n",
                     ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: idempotent\n"
                     "    lineage: [ { re_search: [ x, y ] } ]\n",
                     ERR_DRIVER_FILE);
  check_driver_error("rules:\n"
                     "  - kind: ordering\n"
                     "    lineage: [ { equals: x } ]\n"
                     "    weight: heavy\n", ERR_DRIVER_FILE);
}

BOOST_AUTO_TEST_CASE(several_criteria_per_level)
{
  unique_ptr<RuleSet> rs(hcfg_test::driver(
    "rules:\n"
    "  - kind: idempotent\n"
    "    lineage:\n"
    "      - startswith: [ 'interface Vlan', 'interface Loopback' ]\n"
    "        re_search: '\\d$'\n"
    "  - kind: no_negation\n"
    "    lineage: [ { equals: [ a, b ] } ]\n"));
  vector<string> p(1);
  p[0] = "interface Vlan2";
  BOOST_CHECK(rs->resolvePath(p, RULE_IDEMPOTENT));
  p[0] = "interface Loopback0";
  BOOST_CHECK(rs->resolvePath(p, RULE_IDEMPOTENT));
  // both criteria must hold
  p[0] = "interface Vlan";
  BOOST_CHECK(!rs->resolvePath(p, RULE_IDEMPOTENT));
  p[0] = "interface Tunnel1";
  BOOST_CHECK(!rs->resolvePath(p, RULE_IDEMPOTENT));

  p[0] = "a";
  BOOST_CHECK(rs->resolvePath(p, RULE_NO_NEGATION));
  p[0] = "b";
  BOOST_CHECK(rs->resolvePath(p, RULE_NO_NEGATION));
  p[0] = "c";
  BOOST_CHECK(!rs->resolvePath(p, RULE_NO_NEGATION));
}

BOOST_AUTO_TEST_CASE(bad_pattern_file)
{
  Error err;
  unique_ptr<RuleSet> rs(load_driver_file(
                           hcfg_test::data_path("bad_regex_driver.yaml"),
                           err));
  BOOST_CHECK(!rs);
  BOOST_CHECK_EQUAL(err.getKind(), ERR_INVALID_RULE_PATTERN);
}

BOOST_AUTO_TEST_CASE(missing_files)
{
  Error err;
  BOOST_CHECK(!load_driver_file(hcfg_test::data_path("nope.yaml"), err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_DRIVER_FILE);

  err.clear();
  BOOST_CHECK(!load_tags_file(hcfg_test::data_path("nope.yaml"), err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_DRIVER_FILE);
}

BOOST_AUTO_TEST_CASE(tag_rules_file)
{
  Error err;
  unique_ptr<TagRuleSet> ts(load_tags_file(hcfg_test::data_path("tags.yaml"),
                                           err));
  BOOST_REQUIRE_MESSAGE(ts, err.to_string());
  const vector<TagRule>& rules = ts->getRules();
  BOOST_REQUIRE_EQUAL(rules.size(), 3u);

  BOOST_CHECK_EQUAL(rules[0].getTags().size(), 1u);
  BOOST_CHECK(rules[0].getTags().count("interfaces"));
  BOOST_CHECK_EQUAL(rules[1].getTags().size(), 2u);
  BOOST_CHECK(rules[1].getTags().count("addressing"));
  BOOST_CHECK(rules[1].getTags().count("safe"));
  // a single tag may be given as a plain string
  BOOST_CHECK(rules[2].getTags().count("vlans"));

  vector<string> p;
  p.push_back("vlan 10");
  BOOST_CHECK(rules[2].matches(p));
  p[0] = "vlan 10 name x";
  BOOST_CHECK(!rules[2].matches(p));

  err.clear();
  BOOST_CHECK(!load_tags_text("- lineage: [ { equals: x } ]\n", err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_DRIVER_FILE);
  err.clear();
  BOOST_CHECK(!load_tags_text("add_tags: x\n", err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_DRIVER_FILE);
}

BOOST_AUTO_TEST_CASE(builtin_drivers)
{
  vector<string> names;
  get_builtin_platforms(names);
  BOOST_REQUIRE_EQUAL(names.size(), 3u);
  for (size_t i = 0; i < names.size(); i++) {
    Error err;
    unique_ptr<RuleSet> rs(get_builtin_driver(names[i], err));
    BOOST_REQUIRE_MESSAGE(rs, err.to_string());
    BOOST_CHECK_EQUAL(rs->getOptions().platform, names[i]);
  }

  Error err;
  unique_ptr<RuleSet> ios(get_builtin_driver("cisco_ios", err));
  BOOST_REQUIRE(ios);
  BOOST_CHECK(ios->numRules(RULE_IDEMPOTENT) > 0);
  BOOST_CHECK(ios->numRules(RULE_SECTIONAL_EXITING) > 0);
  vector<string> p;
  p.push_back("interface Vlan2");
  p.push_back("ip address 10.0.2.1 255.255.255.0");
  BOOST_CHECK(ios->resolvePath(p, RULE_IDEMPOTENT));
  // secondary addresses are not idempotent
  p[1] += " secondary";
  BOOST_CHECK(!ios->resolvePath(p, RULE_IDEMPOTENT));

  unique_ptr<RuleSet> junos(get_builtin_driver("juniper_junos", err));
  BOOST_REQUIRE(junos);
  BOOST_CHECK_EQUAL(junos->getOptions().indentation, 4u);
  BOOST_CHECK_EQUAL(junos->getOptions().declaration_prefix, "set ");

  BOOST_CHECK(!get_builtin_driver("cisco_nxos_v2", err));
  BOOST_CHECK_EQUAL(err.getKind(), ERR_DRIVER_FILE);
}

BOOST_AUTO_TEST_SUITE_END()
