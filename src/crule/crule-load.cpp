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
#include <yaml-cpp/yaml.h>

#include <common/output.hpp>
#include <common/fsutil.hpp>
#include <crule/crule.hpp>
#include <crule/crule-load.hpp>

using namespace crule;
using namespace hcfg;
using namespace std;

////// YAML helpers
// a scalar or a list of alternatives
static bool
parse_patterns(const YAML::Node& node, MatchKind kind,
               vector<string>& patterns, Error& err)
{
  if (node.IsScalar()) {
    patterns.push_back(node.as<string>());
    return true;
  }
  if (node.IsSequence() && node.size() > 0 && kind != MATCH_RE_SEARCH) {
    for (size_t i = 0; i < node.size(); i++) {
      if (!node[i].IsScalar()) {
        break;
      }
      patterns.push_back(node[i].as<string>());
    }
    if (patterns.size() == node.size()) {
      return true;
    }
  }
  err.set(ERR_DRIVER_FILE, "%s takes %s", Matcher::kindName(kind),
          (kind == MATCH_RE_SEARCH ? "a single pattern"
           : "a text or a non-empty list of texts"));
  return false;
}

static bool
parse_lineage(const YAML::Node& node, Lineage& lineage, Error& err)
{
  if (!node || !node.IsSequence() || node.size() == 0) {
    err.set(ERR_DRIVER_FILE, "lineage must be a non-empty list");
    return false;
  }
  for (size_t i = 0; i < node.size(); i++) {
    const YAML::Node& m = node[i];
    if (!m.IsMap() || m.size() == 0) {
      err.set(ERR_DRIVER_FILE,
              "lineage level %zu must be a non-empty \"matcher: text\" map",
              i);
      return false;
    }
    // every criterion of a level must match
    Matcher matcher;
    for (YAML::const_iterator it = m.begin(); it != m.end(); ++it) {
      string key = it->first.as<string>();
      MatchKind kind;
      if (!Matcher::parseKind(key, kind)) {
        err.set(ERR_DRIVER_FILE, "unknown matcher [%s]", key.c_str());
        return false;
      }
      vector<string> patterns;
      if (!parse_patterns(it->second, kind, patterns, err)) {
        return false;
      }
      matcher.add(kind, patterns);
    }
    lineage.push_back(matcher);
  }
  return true;
}

static bool
require_key(const YAML::Node& node, const char *key, RuleKind kind,
            Error& err)
{
  if (!node[key]) {
    err.set(ERR_DRIVER_FILE, "%s rule requires \"%s\"",
            Rule::kindName(kind), key);
    return false;
  }
  return true;
}

static bool
parse_rule(const YAML::Node& node, vector<Rule>& rules, Error& err)
{
  if (!node.IsMap() || !node["kind"]) {
    err.set(ERR_DRIVER_FILE, "rule must be a map with a \"kind\"");
    return false;
  }
  string kname = node["kind"].as<string>();
  RuleKind kind;
  if (!Rule::parseKind(kname, kind)) {
    err.set(ERR_DRIVER_FILE, "unknown rule kind [%s]", kname.c_str());
    return false;
  }
  Lineage l;
  if (!parse_lineage(node["lineage"], l, err)) {
    return false;
  }

  switch (kind) {
  case RULE_DEFAULT_NEGATION:
    rules.push_back(Rule::defaultNegation(l,
                      node["token"].as<string>("")));
    break;
  case RULE_NEGATE_WITH:
    if (!require_key(node, "use", kind, err)) {
      return false;
    }
    rules.push_back(Rule::negateWith(l, node["use"].as<string>()));
    break;
  case RULE_IDEMPOTENT:
    rules.push_back(Rule::idempotent(l));
    break;
  case RULE_SECTIONAL_EXITING:
    if (!require_key(node, "exit_text", kind, err)) {
      return false;
    }
    rules.push_back(Rule::sectionalExiting(l,
                      node["exit_text"].as<string>()));
    break;
  case RULE_ORDERING:
    if (!require_key(node, "weight", kind, err)) {
      return false;
    }
    rules.push_back(Rule::ordering(l, node["weight"].as<int>()));
    break;
  case RULE_NO_NEGATION:
    rules.push_back(Rule::noNegation(l));
    break;
  case RULE_DUPLICATE_CHILD_ALLOWED:
    rules.push_back(Rule::duplicateChildAllowed(l));
    break;
  default:
    err.set(ERR_DRIVER_FILE, "unknown rule kind [%s]", kname.c_str());
    return false;
  }
  return true;
}

static RuleSet *
build_driver(const YAML::Node& root, Error& err)
{
  if (!root.IsMap()) {
    err.set(ERR_DRIVER_FILE, "driver document must be a map");
    return NULL;
  }
  DriverOptions opts;
  opts.platform = root["platform"].as<string>("");
  opts.negation_prefix = root["negation_prefix"].as<string>(
                           opts.negation_prefix);
  opts.declaration_prefix = root["declaration_prefix"].as<string>("");
  int indent = root["indentation"].as<int>(1);
  if (indent < 1) {
    err.set(ERR_DRIVER_FILE, "invalid indentation %d", indent);
    return NULL;
  }
  opts.indentation = indent;

  vector<Rule> rules;
  const YAML::Node& rnode = root["rules"];
  if (rnode) {
    if (!rnode.IsSequence()) {
      err.set(ERR_DRIVER_FILE, "\"rules\" must be a list");
      return NULL;
    }
    for (size_t i = 0; i < rnode.size(); i++) {
      if (!parse_rule(rnode[i], rules, err)) {
        return NULL;
      }
    }
  }
  return RuleSet::create(rules, err, opts);
}

static TagRuleSet *
build_tags(const YAML::Node& root, Error& err)
{
  if (root.IsNull()) {
    return TagRuleSet::create(vector<TagRule>(), err);
  }
  if (!root.IsSequence()) {
    err.set(ERR_DRIVER_FILE, "tag rule document must be a list");
    return NULL;
  }
  vector<TagRule> rules;
  for (size_t i = 0; i < root.size(); i++) {
    const YAML::Node& n = root[i];
    if (!n.IsMap() || !n["add_tags"]) {
      err.set(ERR_DRIVER_FILE, "tag rule %zu requires \"add_tags\"", i);
      return NULL;
    }
    Lineage l;
    if (!parse_lineage(n["lineage"], l, err)) {
      return NULL;
    }
    set<string> tags;
    const YAML::Node& t = n["add_tags"];
    if (t.IsSequence()) {
      for (size_t j = 0; j < t.size(); j++) {
        tags.insert(t[j].as<string>());
      }
    } else {
      tags.insert(t.as<string>());
    }
    rules.push_back(TagRule(l, tags));
  }
  return TagRuleSet::create(rules, err);
}


////// drivers
RuleSet *
crule::load_driver_text(const string& yaml, Error& err)
{
  try {
    return build_driver(YAML::Load(yaml), err);
  } catch (const YAML::Exception& e) {
    err.set(ERR_DRIVER_FILE, "invalid driver document: %s", e.what());
  }
  return NULL;
}

RuleSet *
crule::load_driver_file(const string& path, Error& err)
{
  string data, why;
  if (!read_whole_file(path, data, why)) {
    err.set(ERR_DRIVER_FILE, "cannot read driver [%s]: %s",
            path.c_str(), why.c_str());
    return NULL;
  }
  RuleSet *rs = load_driver_text(data, err);
  if (!rs) {
    output_internal("failed to load driver [%s]: %s\n", path.c_str(),
                    err.getMessage().c_str());
  }
  return rs;
}


////// tags
TagRuleSet *
crule::load_tags_text(const string& yaml, Error& err)
{
  try {
    return build_tags(YAML::Load(yaml), err);
  } catch (const YAML::Exception& e) {
    err.set(ERR_DRIVER_FILE, "invalid tag rule document: %s", e.what());
  }
  return NULL;
}

TagRuleSet *
crule::load_tags_file(const string& path, Error& err)
{
  string data, why;
  if (!read_whole_file(path, data, why)) {
    err.set(ERR_DRIVER_FILE, "cannot read tag rules [%s]: %s",
            path.c_str(), why.c_str());
    return NULL;
  }
  return load_tags_text(data, err);
}


////// builtin drivers
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

static void
cisco_ios_rules(vector<Rule>& rules)
{
  Matcher intf = Matcher::startswith("interface ");
  Matcher bgp = Matcher::startswith("router bgp ");

  rules.push_back(Rule::idempotent(lin(Matcher::startswith("hostname "))));
  rules.push_back(Rule::idempotent(lin(Matcher::startswith("vlan "),
                                       Matcher::startswith("name "))));
  rules.push_back(Rule::idempotent(lin(intf,
                                       Matcher::startswith("description "))));
  rules.push_back(Rule::idempotent(lin(intf,
                    Matcher::re_search("^ip address \\S+ \\S+$"))));
  rules.push_back(Rule::idempotent(lin(intf, Matcher::startswith("mtu "))));
  rules.push_back(Rule::idempotent(lin(Matcher::startswith("router ospf "),
                    Matcher::startswith("router-id "))));
  rules.push_back(Rule::idempotent(lin(bgp,
                    Matcher::startswith("bgp router-id "))));
  rules.push_back(Rule::idempotent(
                    lin(Matcher::startswith("logging console "))));

  rules.push_back(Rule::negateWith(lin(Matcher::startswith("logging console ")),
                                   "logging console debugging"));
  rules.push_back(Rule::defaultNegation(
                    lin(Matcher::startswith("logging event ")), "default "));
  rules.push_back(Rule::noNegation(
                    lin(Matcher::startswith("service timestamps "))));

  rules.push_back(Rule::sectionalExiting(lin(bgp,
                    Matcher::startswith("template peer-policy")),
                    "exit-peer-policy"));
  rules.push_back(Rule::sectionalExiting(lin(bgp,
                    Matcher::startswith("template peer-session")),
                    "exit-peer-session"));
  rules.push_back(Rule::sectionalExiting(lin(bgp,
                    Matcher::startswith("address-family ")),
                    "exit-address-family"));

  rules.push_back(Rule::ordering(lin(intf,
                    Matcher::startswith("switchport mode ")), -10));
  rules.push_back(Rule::ordering(lin(Matcher::startswith("no vlan filter")),
                                 200));
  rules.push_back(Rule::ordering(lin(intf, Matcher::equals("no shutdown")),
                                 100));

  rules.push_back(Rule::duplicateChildAllowed(
                    lin(Matcher::startswith("banner "))));
}

static void
juniper_junos_rules(vector<Rule>& rules)
{
  rules.push_back(Rule::idempotent(
                    lin(Matcher::startswith("set system host-name "))));
}

void
crule::get_builtin_platforms(vector<string>& names)
{
  names.clear();
  names.push_back("generic");
  names.push_back("cisco_ios");
  names.push_back("juniper_junos");
}

RuleSet *
crule::get_builtin_driver(const string& platform, Error& err)
{
  DriverOptions opts;
  vector<Rule> rules;
  opts.platform = platform;
  if (platform == "generic") {
    // defaults
  } else if (platform == "cisco_ios") {
    cisco_ios_rules(rules);
  } else if (platform == "juniper_junos") {
    opts.negation_prefix = "delete ";
    opts.declaration_prefix = "set ";
    opts.indentation = 4;
    juniper_junos_rules(rules);
  } else {
    err.set(ERR_DRIVER_FILE, "unknown platform [%s]", platform.c_str());
    return NULL;
  }
  return RuleSet::create(rules, err, opts);
}
