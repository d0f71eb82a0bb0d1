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

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <string>
#include <set>
#include <memory>
#include <getopt.h>

#include <common/error.hpp>
#include <common/output.hpp>
#include <ctree/ctree.hpp>
#include <ctree/ctree-parse.hpp>
#include <ctree/ctree-algorithm.hpp>
#include <crule/crule.hpp>
#include <crule/crule-load.hpp>
#include <remed/remed-algorithm.hpp>
#include <ctag/ctag.hpp>

using namespace hcfg;
using namespace std;

/* This program provides a shell API to the hcfg library. Config files are
 * given as paths to vendor text; the platform rules come from a driver
 * file (--driver or $HCFG_DRIVER) or a builtin driver (--platform or
 * $HCFG_PLATFORM, "generic" if neither is set).
 *
 * Output goes to stdout. Failures are reported on stderr and the program
 * exits with non-zero status.
 */

//// options
int op_with_comments = 0;
char *op_driver = NULL;
char *op_platform = NULL;
char *op_tags = NULL;

typedef void (*OpFuncT)(const crule::RuleSet& rules,
                        const vector<string>& args);

typedef struct {
  const char *op_name;
  const int op_exact_args;
  const char *op_exact_error;
  const int op_min_args;
  const char *op_min_error;
  OpFuncT op_func;
} OpT;

static void
_fail(const Error& err)
{
  output_user_err("%s\n", err.to_string().c_str());
  exit(1);
}

static ctree::CfgTree *
_load_config(const string& path, const crule::RuleSet& rules)
{
  Error err;
  ctree::CfgTree *tree = ctree::parse_file(path, &rules, err);
  if (!tree) {
    _fail(err);
  }
  return tree;
}

static crule::TagRuleSet *
_load_tags()
{
  if (!op_tags) {
    output_user_err("Must specify tag rules with --tags\n");
    exit(1);
  }
  Error err;
  crule::TagRuleSet *trs = crule::load_tags_file(op_tags, err);
  if (!trs) {
    _fail(err);
  }
  return trs;
}

static crule::RuleSet *
_load_rules()
{
  Error err;
  crule::RuleSet *rules = NULL;
  string driver = (op_driver ? op_driver : get_env(C_ENV_DRIVER));
  if (!driver.empty()) {
    rules = crule::load_driver_file(driver, err);
  } else {
    string platform = (op_platform ? op_platform
                       : get_env(C_ENV_PLATFORM, "generic"));
    rules = crule::get_builtin_driver(platform, err);
  }
  if (!rules) {
    _fail(err);
  }
  return rules;
}

static void
_show(const ctree::CfgTree& tree, const crule::RuleSet& rules)
{
  ctree::show_tree(tree, rules.getOptions().indentation, op_with_comments);
}

static void
_report_diags(const vector<Error>& diags)
{
  for (size_t i = 0; i < diags.size(); i++) {
    output_user_err("warning: %s\n", diags[i].getMessage().c_str());
  }
}

/* show the remediation from running (args[0]) to target (args[1]). any
 * further args are tags: only the remediation lines carrying one of them
 * (according to the --tags rules) are shown.
 */
static void
showRemediation(const crule::RuleSet& rules, const vector<string>& args)
{
  unique_ptr<ctree::CfgTree> running(_load_config(args[0], rules));
  unique_ptr<ctree::CfgTree> target(_load_config(args[1], rules));
  vector<Error> diags;
  unique_ptr<ctree::CfgTree> rem(remed::compare(*running, *target, rules,
                                                &diags));
  _report_diags(diags);
  if (args.size() == 2) {
    _show(*rem, rules);
    return;
  }

  unique_ptr<crule::TagRuleSet> trs(_load_tags());
  set<string> include(args.begin() + 2, args.end());
  unique_ptr<ctree::CfgTree> tagged(ctag::apply_tags(*rem, *trs));
  unique_ptr<ctree::CfgTree> filtered(ctag::filter_by_tags(*tagged, include,
                                                           set<string>()));
  _show(*filtered, rules);
}

static void
showFuture(const crule::RuleSet& rules, const vector<string>& args)
{
  unique_ptr<ctree::CfgTree> running(_load_config(args[0], rules));
  unique_ptr<ctree::CfgTree> target(_load_config(args[1], rules));
  unique_ptr<ctree::CfgTree> future(remed::predict_from_target(*running,
                                                               *target,
                                                               rules));
  _show(*future, rules);
}

// the remediation that undoes showRemediation for the same args
static void
showRollback(const crule::RuleSet& rules, const vector<string>& args)
{
  unique_ptr<ctree::CfgTree> running(_load_config(args[0], rules));
  unique_ptr<ctree::CfgTree> target(_load_config(args[1], rules));
  unique_ptr<ctree::CfgTree> future(remed::predict_from_target(*running,
                                                               *target,
                                                               rules));
  vector<Error> diags;
  unique_ptr<ctree::CfgTree> rb(remed::rollback(*future, *running, rules,
                                                &diags));
  _report_diags(diags);
  _show(*rb, rules);
}

static void
showDiff(const crule::RuleSet& rules, const vector<string>& args)
{
  unique_ptr<ctree::CfgTree> cfg1(_load_config(args[0], rules));
  unique_ptr<ctree::CfgTree> cfg2(_load_config(args[1], rules));
  ctree::show_tree_diff(*cfg1, *cfg2, rules.getOptions().indentation);
}

// lines of args[0] that are not in args[1]
static void
showDifference(const crule::RuleSet& rules, const vector<string>& args)
{
  unique_ptr<ctree::CfgTree> cfg1(_load_config(args[0], rules));
  unique_ptr<ctree::CfgTree> cfg2(_load_config(args[1], rules));
  unique_ptr<ctree::CfgTree> diff(remed::difference(*cfg1, *cfg2, rules));
  _show(*diff, rules);
}

// show the lines of the config (args[0]) that carry any of the tags
static void
showTagged(const crule::RuleSet& rules, const vector<string>& args)
{
  unique_ptr<ctree::CfgTree> cfg(_load_config(args[0], rules));
  unique_ptr<crule::TagRuleSet> trs(_load_tags());
  unique_ptr<ctree::CfgTree> tagged(ctag::apply_tags(*cfg, *trs));
  set<string> include(args.begin() + 1, args.end());
  unique_ptr<ctree::CfgTree> filtered(ctag::filter_by_tags(*tagged, include,
                                                           set<string>()));
  _show(*filtered, rules);
}

/* exit 0 if the driver file loads (output the number of rules of each
 * kind), 1 otherwise.
 */
static void
validateDriver(const crule::RuleSet& rules, const vector<string>& args)
{
  Error err;
  unique_ptr<crule::RuleSet> rs(crule::load_driver_file(args[0], err));
  if (!rs) {
    _fail(err);
  }
  for (int k = 0; k < crule::RULE_KIND_COUNT; k++) {
    crule::RuleKind kind = static_cast<crule::RuleKind>(k);
    output_user("%s: %zu\n", crule::Rule::kindName(kind),
                rs->numRules(kind));
  }
}

#define OP(name, exact, exact_err, min, min_err) \
  { #name, exact, exact_err, min, min_err, &name }

static int op_idx = -1;
static OpT ops[] = {
  OP(showRemediation, -1, NULL, 2, "Must specify running and target"),
  OP(showFuture, 2, "Must specify running and target", -1, NULL),
  OP(showRollback, 2, "Must specify running and target", -1, NULL),
  OP(showDiff, 2, "Must specify two configs", -1, NULL),
  OP(showDifference, 2, "Must specify two configs", -1, NULL),
  OP(showTagged, -1, NULL, 2, "Must specify config and tags"),
  OP(validateDriver, 1, "Must specify driver file", -1, NULL),

  {NULL, -1, NULL, -1, NULL, NULL}
};
#define OP_exact_args  ops[op_idx].op_exact_args
#define OP_min_args    ops[op_idx].op_min_args
#define OP_exact_error ops[op_idx].op_exact_error
#define OP_min_error   ops[op_idx].op_min_error
#define OP_func        ops[op_idx].op_func

enum {
  OPT_DRIVER = 1,
  OPT_PLATFORM,
  OPT_TAGS
};

struct option options[] = {
  {"with-comments", no_argument, &op_with_comments, 1},
  {"driver", required_argument, NULL, OPT_DRIVER},
  {"platform", required_argument, NULL, OPT_PLATFORM},
  {"tags", required_argument, NULL, OPT_TAGS},
  {NULL, 0, NULL, 0}
};

int
main(int argc, char **argv)
{
  // handle options first
  int c = 0;
  while ((c = getopt_long(argc, argv, "", options, NULL)) != -1) {
    switch (c) {
      case OPT_DRIVER:
        op_driver = optarg;
        break;
      case OPT_PLATFORM:
        op_platform = optarg;
        break;
      case OPT_TAGS:
        op_tags = optarg;
        break;
      case '?':
        exit(1);
      default:
        break;
    }
  }
  int nargs = argc - optind - 1;
  if (nargs < 0) {
    fprintf(stderr, "Must specify operation\n");
    exit(1);
  }
  char *oname = argv[optind];

  int i = 0;
  while (ops[i].op_name) {
    if (strcmp(oname, ops[i].op_name) == 0) {
      op_idx = i;
      break;
    }
    ++i;
  }
  if (op_idx == -1) {
    fprintf(stderr, "Invalid operation\n");
    exit(1);
  }
  if (OP_exact_args >= 0 && nargs != OP_exact_args) {
    fprintf(stderr, "%s\n", OP_exact_error);
    exit(1);
  }
  if (OP_min_args >= 0 && nargs < OP_min_args) {
    fprintf(stderr, "%s\n", OP_min_error);
    exit(1);
  }

  vector<string> args(argv + optind + 1, argv + argc);

  // call the op function
  unique_ptr<crule::RuleSet> rules(_load_rules());
  OP_func(*rules, args);
  rules.reset();
  exit(0);
}
