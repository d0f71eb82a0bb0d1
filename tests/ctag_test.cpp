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
#include <set>
#include <memory>
#include <boost/test/unit_test.hpp>

#include <common/error.hpp>
#include <ctree/ctree.hpp>
#include <crule/crule.hpp>
#include <crule/crule-load.hpp>
#include <remed/remed-algorithm.hpp>
#include <ctag/ctag.hpp>
#include "test_util.hpp"

using namespace ctag;
using namespace ctree;
using namespace hcfg;
using namespace std;

typedef unique_ptr<CfgTree> TreeP;

static const char *CONFIG =
  "interface Vlan2\n"
  " mtu 9000\n"
  " ip address 10.0.2.1 255.255.255.0\n"
  "vlan 2\n"
  " name x\n"
  "hostname r1\n";

static set<string>
tags_of(const char *t1 = NULL, const char *t2 = NULL)
{
  set<string> s;
  if (t1) {
    s.insert(t1);
  }
  if (t2) {
    s.insert(t2);
  }
  return s;
}

struct TaggedConfig {
  TaggedConfig() {
    Error err;
    rules.reset(crule::load_tags_file(hcfg_test::data_path("tags.yaml"),
                                      err));
    BOOST_REQUIRE_MESSAGE(rules, err.to_string());
    config.reset(hcfg_test::parse(CONFIG));
    tagged.reset(apply_tags(*config, *rules));
  }

  CfgNode *node(const char *p1, const char *p2 = NULL) {
    vector<string> p;
    p.push_back(p1);
    if (p2) {
      p.push_back(p2);
    }
    return tagged->find(p);
  }

  unique_ptr<crule::TagRuleSet> rules;
  TreeP config;
  TreeP tagged;
};

BOOST_FIXTURE_TEST_SUITE(ctag_tags, TaggedConfig)

BOOST_AUTO_TEST_CASE(tags_go_to_leaves)
{
  BOOST_CHECK(node("interface Vlan2")->getTags().empty());
  BOOST_CHECK(node("interface Vlan2", "mtu 9000")->hasTag("interfaces"));
  CfgNode *ip = node("interface Vlan2", "ip address 10.0.2.1 255.255.255.0");
  BOOST_CHECK_EQUAL(ip->getTags().size(), 3u);
  BOOST_CHECK(ip->hasTag("addressing"));
  BOOST_CHECK(ip->hasTag("safe"));
  BOOST_CHECK(node("vlan 2", "name x")->hasTag("vlans"));
  BOOST_CHECK(node("hostname r1")->getTags().empty());

  set<string> all;
  get_tags(*node("interface Vlan2"), all);
  BOOST_CHECK_EQUAL(all.size(), 3u);
  BOOST_CHECK(all.count("interfaces"));
  BOOST_CHECK(all.count("safe"));

  // the input tree is not tagged
  BOOST_CHECK(config->equals(*tagged));
  set<string> none;
  get_tags(config->getRoot(), none);
  BOOST_CHECK(none.empty());
}

BOOST_AUTO_TEST_CASE(add_tags_on_sections)
{
  CfgNode *vlan = node("vlan 2");
  add_tags(*vlan, tags_of("manual"));
  BOOST_CHECK(!vlan->hasTag("manual"));
  BOOST_CHECK(node("vlan 2", "name x")->hasTag("manual"));

  CfgNode *host = node("hostname r1");
  add_tags(*host, tags_of("manual"));
  BOOST_CHECK(host->hasTag("manual"));
}

BOOST_AUTO_TEST_CASE(filter_single_tag)
{
  TreeP f(filter_by_tag(*tagged, "addressing"));
  CHECK_LINES(*f,
              "interface Vlan2\n"
              " ip address 10.0.2.1 255.255.255.0\n");

  TreeP v(filter_by_tag(*tagged, "vlans"));
  CHECK_LINES(*v, "vlan 2\n name x\n");

  TreeP n(filter_by_tag(*tagged, "nothing"));
  BOOST_CHECK(n->empty());
}

BOOST_AUTO_TEST_CASE(filter_include_exclude)
{
  TreeP f1(filter_by_tags(*tagged, tags_of("interfaces"), tags_of("safe")));
  CHECK_LINES(*f1, "interface Vlan2\n mtu 9000\n");

  TreeP f2(filter_by_tags(*tagged, set<string>(), tags_of("interfaces")));
  CHECK_LINES(*f2, "vlan 2\n name x\nhostname r1\n");

  TreeP f3(filter_by_tags(*tagged, tags_of("vlans", "addressing"),
                          set<string>()));
  CHECK_LINES(*f3,
              "interface Vlan2\n"
              " ip address 10.0.2.1 255.255.255.0\n"
              "vlan 2\n"
              " name x\n");

  // neither include nor exclude: nothing is included
  TreeP f4(filter_by_tags(*tagged, set<string>(), set<string>()));
  BOOST_CHECK(f4->empty());
}

BOOST_AUTO_TEST_CASE(inclusion_test)
{
  CfgNode *ip = node("interface Vlan2", "ip address 10.0.2.1 255.255.255.0");
  BOOST_CHECK(line_inclusion_test(*ip, tags_of("safe"), set<string>()));
  BOOST_CHECK(!line_inclusion_test(*ip, tags_of("safe"), tags_of("safe")));
  BOOST_CHECK(!line_inclusion_test(*ip, tags_of("vlans"), set<string>()));
  BOOST_CHECK(!line_inclusion_test(*ip, set<string>(), tags_of("addressing")));

  CfgNode *host = node("hostname r1");
  BOOST_CHECK(line_inclusion_test(*host, set<string>(), tags_of("safe")));
  BOOST_CHECK(!line_inclusion_test(*host, set<string>(), set<string>()));
}

BOOST_AUTO_TEST_CASE(tagged_remediation)
{
  unique_ptr<crule::RuleSet> drv(hcfg_test::driver("rules: []\n"));
  TreeP running(hcfg_test::parse("interface Vlan2\n mtu 1500\n"));
  TreeP rem(remed::compare(*running, *config, *drv));
  TreeP trem(apply_tags(*rem, *rules));
  TreeP safe(filter_by_tags(*trem, tags_of("safe"), set<string>()));
  CHECK_LINES(*safe,
              "interface Vlan2\n"
              " ip address 10.0.2.1 255.255.255.0\n");

  vector<string> p;
  p.push_back("interface Vlan2");
  p.push_back("no mtu 1500");
  CfgNode *n = trem->find(p);
  BOOST_REQUIRE(n);
  BOOST_CHECK_EQUAL(n->getRemedOp(), remed::REMED_REMOVE);
  BOOST_CHECK(n->hasTag("interfaces"));
}

BOOST_AUTO_TEST_SUITE_END()
