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

#include <cstdio>
#include <vector>
#include <string>
#include <set>
#include <memory>
#include <chrono>

#include <common/util.hpp>
#include <common/output.hpp>
#include <ctree/ctree.hpp>
#include <crule/crule.hpp>
#include <remed/remed-data.hpp>
#include <remed/remed-algorithm.hpp>

using namespace remed;
using namespace ctree;
using namespace crule;
using namespace hcfg;
using namespace std;
using namespace chrono;

////// debugging helpers
#define TRACE_INIT(fmt, ...) \
  bool debug_on = debug_enabled(); \
  time_point<high_resolution_clock> start_time; \
  if (debug_on) { \
    output_internal(fmt "\n", ##__VA_ARGS__); \
    start_time = high_resolution_clock::now(); \
  }

#define TRACE_DISPLAY(fmt, ...) \
  if (debug_on) { \
    time_point<high_resolution_clock> stop_time = high_resolution_clock::now(); \
    int total_ms = duration_cast<milliseconds>(stop_time - start_time).count(); \
    int sec_elapsed = total_ms / 1000; \
    int ms_elapsed = total_ms % 1000; \
    output_internal("Elapsed %d.%03d sec: " fmt "\n", \
                    sec_elapsed, ms_elapsed, ##__VA_ARGS__); \
  }

////// constants
static const string C_COMMENT_NEW_SECTION = "new section";
static const string C_DEFAULT_PREFIX = "default ";

typedef MapT<string, size_t> OccurMapT;


////// static (internal) functions
static string
_path_str(const CfgNode& node)
{
  vector<string> path;
  node.getPath(path);
  string s;
  for (size_t i = 0; i < path.size(); i++) {
    if (i > 0) {
      s += " / ";
    }
    s += path[i];
  }
  return s;
}

/* partner of each child of "from" among the children of "to". children
 * are paired by text, and repeated texts by occurrence index.
 */
static void
_pair_children(const CfgNode& from, const CfgNode& to,
               vector<const CfgNode *>& partners)
{
  OccurMapT seen;
  partners.clear();
  for (size_t i = 0; i < from.numChildNodes(); i++) {
    const string& t = from.childAt(i)->getText();
    size_t k = seen[t]++;
    partners.push_back(to.findChild(t, k));
  }
}

/* pair unmatched running and target children that fill the same
 * idempotent slot. superseded[j] is the running child replaced by target
 * child j. a slot that has more than one line on either side cannot be
 * paired and is reported.
 */
static void
_pair_idempotent(const CfgNode& rnode, const CfgNode& tnode,
                 const vector<const CfgNode *>& rpartners,
                 const vector<const CfgNode *>& tpartners,
                 const RuleSet& rules,
                 vector<const CfgNode *>& superseded,
                 vector<bool>& rsuperseded, vector<Error> *diags)
{
  superseded.assign(tnode.numChildNodes(), NULL);
  rsuperseded.assign(rnode.numChildNodes(), false);
  if (rules.numRules(RULE_IDEMPOTENT) == 0) {
    return;
  }

  vector<const Rule *> slots;
  MapT<const Rule *, vector<size_t> > ronly, tonly;
  MapT<const Rule *, size_t> rcount, tcount;
  for (size_t i = 0; i < rnode.numChildNodes(); i++) {
    const Rule *r = rules.resolve(*(rnode.childAt(i)), RULE_IDEMPOTENT);
    if (!r) {
      continue;
    }
    if (rcount[r]++ == 0) {
      slots.push_back(r);
    }
    if (!rpartners[i]) {
      ronly[r].push_back(i);
    }
  }
  for (size_t j = 0; j < tnode.numChildNodes(); j++) {
    const Rule *r = rules.resolve(*(tnode.childAt(j)), RULE_IDEMPOTENT);
    if (!r) {
      continue;
    }
    if (tcount[r]++ == 0 && rcount.find(r) == rcount.end()) {
      slots.push_back(r);
    }
    if (!tpartners[j]) {
      tonly[r].push_back(j);
    }
  }

  for (size_t s = 0; s < slots.size(); s++) {
    const Rule *r = slots[s];
    const vector<size_t>& ri = ronly[r];
    const vector<size_t>& tj = tonly[r];
    if (ri.empty() || tj.empty()) {
      // pure addition or removal
      continue;
    }
    if (rcount[r] == 1 && tcount[r] == 1) {
      superseded[tj[0]] = rnode.childAt(ri[0]);
      rsuperseded[ri[0]] = true;
      continue;
    }
    Error e;
    e.set(ERR_AMBIGUOUS_IDEMPOTENT_MATCH,
          "%zu running and %zu target lines claim the idempotent slot of "
          "[%s]", rcount[r], tcount[r],
          _path_str(*(tnode.childAt(tj[0]))).c_str());
    output_internal("%s\n", e.to_string().c_str());
    if (diags) {
      diags->push_back(e);
    }
  }
}

static void
_add_removal(const CfgNode& rc, CfgNode& dnode, bool dup,
             const RuleSet& rules)
{
  string text;
  const Rule *nw = rules.resolve(rc, RULE_NEGATE_WITH);
  if (nw) {
    text = nw->getReplacement();
  } else if (rules.resolve(rc, RULE_NO_NEGATION)) {
    return;
  } else {
    const Rule *dn = rules.resolve(rc, RULE_DEFAULT_NEGATION);
    text = rules.negate(rc.getText(), (dn ? dn->getNegationToken() : ""));
  }

  CfgNode *dc = dnode.addChild(text, dup);
  if (!dc) {
    return;
  }
  if (dc->getRemedOp() == REMED_REMOVE) {
    // same negation already emitted for another line
    dc->addSourceText(rc.getText());
    return;
  }
  dc->setRemedOp(REMED_REMOVE);
  dc->setRemedOrigin(&rc);
  dc->addSourceText(rc.getText());
  if (!rc.isLeaf()) {
    char buf[64];
    snprintf(buf, sizeof(buf), "removes %zu lines", rc.numChildNodes() + 1);
    dc->addComment(buf);
  }
}

static CfgNode *
_copy_new(const CfgNode& src, bool force_dup, const RuleSet& rules)
{
  CfgNode *dc = src.copyShallow();
  dc->clearRemedData();
  dc->setRemedOp(REMED_ADD);
  dc->setRemedOrigin(&src);
  dc->setNewInConfig(true);
  dc->setForceDuplicate(force_dup);
  bool cdup = rules.duplicateChildAllowed(src);
  for (size_t i = 0; i < src.numChildNodes(); i++) {
    dc->addChildNode(_copy_new(*(src.childAt(i)), cdup, rules));
  }
  return dc;
}

static void
_add_new(const CfgNode& tc, CfgNode& dnode, bool dup,
         const CfgNode *superseded, const RuleSet& rules)
{
  CfgNode *existing = (dup ? NULL : dnode.findChild(tc.getText()));
  if (existing) {
    // e.g., "no X" both removes "X" and is itself a target line
    existing->setNewInConfig(true);
    bool cdup = rules.duplicateChildAllowed(tc);
    for (size_t i = 0; i < tc.numChildNodes(); i++) {
      const CfgNode *c = tc.childAt(i);
      if (cdup || !existing->findChild(c->getText())) {
        existing->addChildNode(_copy_new(*c, cdup, rules));
      }
    }
    return;
  }

  CfgNode *dc = _copy_new(tc, dup, rules);
  if (superseded) {
    dc->setSupersededText(superseded->getText());
  }
  if (!dc->isLeaf()) {
    dc->addComment(C_COMMENT_NEW_SECTION);
  }
  dnode.addChildNode(dc);
}

static void _compare_level(const CfgNode& rnode, const CfgNode& tnode,
                           CfgNode& dnode, const RuleSet& rules,
                           vector<Error> *diags);

// a line present on both sides: keep it only if something below changed
static void
_add_context(const CfgNode& rc, const CfgNode& tc, CfgNode& dnode,
             const RuleSet& rules, vector<Error> *diags)
{
  CfgNode *dc = tc.copyShallow();
  dc->clearRemedData();
  dc->setRemedOp(REMED_ADD);
  dc->setRemedOrigin(&tc);
  dnode.addChildNode(dc);
  _compare_level(rc, tc, *dc, rules, diags);
  if (dc->isLeaf()) {
    dnode.deleteChildNode(dc);
  }
}

static void
_compare_level(const CfgNode& rnode, const CfgNode& tnode, CfgNode& dnode,
               const RuleSet& rules, vector<Error> *diags)
{
  vector<const CfgNode *> rpartners;
  vector<const CfgNode *> tpartners;
  _pair_children(rnode, tnode, rpartners);
  _pair_children(tnode, rnode, tpartners);

  vector<const CfgNode *> superseded;
  vector<bool> rsuperseded;
  _pair_idempotent(rnode, tnode, rpartners, tpartners, rules, superseded,
                   rsuperseded, diags);

  bool dup = rules.duplicateChildAllowed(tnode);

  // what to remove, in running order
  for (size_t i = 0; i < rnode.numChildNodes(); i++) {
    if (!rpartners[i] && !rsuperseded[i]) {
      _add_removal(*(rnode.childAt(i)), dnode, dup, rules);
    }
  }

  // what to add or descend into, in target order
  for (size_t j = 0; j < tnode.numChildNodes(); j++) {
    const CfgNode *tc = tnode.childAt(j);
    if (tpartners[j]) {
      _add_context(*(tpartners[j]), *tc, dnode, rules, diags);
    } else {
      _add_new(*tc, dnode, dup, superseded[j], rules);
    }
  }
}

static bool
_cmp_order_weight(const CfgNode *a, const CfgNode *b)
{
  return (a->getOrderWeight() < b->getOrderWeight());
}

static void
_apply_ordering(CfgNode& dnode, const RuleSet& rules)
{
  for (size_t i = 0; i < dnode.numChildNodes(); i++) {
    CfgNode *c = dnode.childAt(i);
    const Rule *r = rules.resolve(*c, RULE_ORDERING);
    if (r) {
      c->setOrderWeight(r->getWeight());
    }
    _apply_ordering(*c, rules);
  }
  dnode.sortChildNodes(_cmp_order_weight);
}

static void
_add_exit_markers(CfgNode& dnode, const RuleSet& rules)
{
  for (size_t i = 0; i < dnode.numChildNodes(); i++) {
    _add_exit_markers(*(dnode.childAt(i)), rules);
  }
  const CfgNode *src = dnode.getRemedOrigin();
  if (dnode.isRoot() || !src) {
    return;
  }

  bool section = false;
  if (dnode.getRemedOp() == REMED_REMOVE) {
    // an explicit negation replaces the whole block
    section = (!src->isLeaf() && !rules.resolve(*src, RULE_NEGATE_WITH));
  } else {
    section = !dnode.isLeaf();
  }
  if (!section) {
    return;
  }
  const Rule *se = rules.resolve(*src, RULE_SECTIONAL_EXITING);
  if (!se || se->getExitText().empty()) {
    return;
  }
  CfgNode *m = new CfgNode(se->getExitText());
  m->setRemedOp(REMED_ADD);
  m->setSectionalExit(true);
  m->setForceDuplicate(true);
  dnode.addChildNode(m);
}

static int
_find_unconsumed(const CfgNode& rnode, const vector<bool>& consumed,
                 const string& text)
{
  for (size_t i = 0; i < rnode.numChildNodes(); i++) {
    if (!consumed[i] && rnode.childAt(i)->getText() == text) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

static void
_predict_level(const CfgNode& rnode, const CfgNode& dnode, CfgNode& fnode)
{
  vector<bool> consumed(rnode.numChildNodes(), false);
  for (size_t i = 0; i < dnode.numChildNodes(); i++) {
    const CfgNode *dc = dnode.childAt(i);
    if (dc->isSectionalExit()) {
      continue;
    }
    int idx;
    if (dc->getRemedOp() == REMED_REMOVE) {
      const vector<string>& srcs = dc->getSourceTexts();
      for (size_t k = 0; k < srcs.size(); k++) {
        idx = _find_unconsumed(rnode, consumed, srcs[k]);
        if (idx >= 0) {
          consumed[idx] = true;
        }
      }
      continue;
    }

    if (dc->supersedes()) {
      idx = _find_unconsumed(rnode, consumed, dc->getSupersededText());
      if (idx >= 0) {
        consumed[idx] = true;
      }
    }
    if (!dc->isForceDuplicate()) {
      idx = _find_unconsumed(rnode, consumed, dc->getText());
      if (idx >= 0) {
        consumed[idx] = true;
        const CfgNode *rc = rnode.childAt(idx);
        CfgNode *fc = rc->copyShallow();
        fc->clearRemedData();
        fnode.addChildNode(fc);
        _predict_level(*rc, *dc, *fc);
        continue;
      }
    }

    // new line
    CfgNode *fc = new CfgNode(dc->getText());
    const set<string>& tags = dc->getTags();
    for (set<string>::const_iterator it = tags.begin(); it != tags.end();
         ++it) {
      fc->addTag(*it);
    }
    fnode.addChildNode(fc);
    const CfgNode empty;
    _predict_level(empty, *dc, *fc);
  }

  // untouched lines keep their order after everything that changed
  for (size_t i = 0; i < rnode.numChildNodes(); i++) {
    if (!consumed[i]) {
      CfgNode *fc = rnode.childAt(i)->copyDeep();
      fc->clearRemedData();
      fnode.addChildNode(fc);
    }
  }
}

static bool
_is_acl_section(const string& text)
{
  return (str_startswith(text, "ip access-list ")
          || str_startswith(text, "ipv4 access-list ")
          || str_startswith(text, "ipv6 access-list "));
}

// "10 permit ip any any" => "permit ip any any"
static string
_strip_acl_seq(const string& text)
{
  size_t i = 0;
  while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
    ++i;
  }
  if (i > 0 && i < text.size() && text[i] == ' ') {
    return text.substr(i + 1);
  }
  return text;
}

static void
_difference(const CfgNode& cfg1, const CfgNode& cfg2, CfgNode& out,
            const string& nprefix)
{
  bool acl = (!cfg1.isRoot() && _is_acl_section(cfg1.getText()));
  set<string> entries;
  if (acl) {
    for (size_t i = 0; i < cfg2.numChildNodes(); i++) {
      entries.insert(_strip_acl_seq(cfg2.childAt(i)->getText()));
    }
  }

  for (size_t i = 0; i < cfg1.numChildNodes(); i++) {
    const CfgNode *c1 = cfg1.childAt(i);
    const string& t = c1->getText();
    if ((!nprefix.empty() && str_startswith(t, nprefix))
        || str_startswith(t, C_DEFAULT_PREFIX)) {
      // negations and defaults are not compared
      continue;
    }
    if (acl) {
      if (entries.find(_strip_acl_seq(c1->getText())) == entries.end()) {
        out.addChildNode(c1->copyDeep());
      }
      continue;
    }
    const CfgNode *c2 = cfg2.findChild(c1->getText());
    if (!c2) {
      out.addChildNode(c1->copyDeep());
      continue;
    }
    CfgNode *sub = c1->copyShallow();
    out.addChildNode(sub);
    _difference(*c1, *c2, *sub, nprefix);
    if (sub->isLeaf()) {
      out.deleteChildNode(sub);
    }
  }
}


////// algorithms
CfgTree *
remed::compare(const CfgTree& running, const CfgTree& target,
               const RuleSet& rules, vector<Error> *diags)
{
  TRACE_INIT("Comparing %zu running lines to %zu target lines",
             running.size(), target.size());
  CfgTree *rem = new CfgTree();
  CfgNode& droot = rem->getRoot();
  _compare_level(running.getRoot(), target.getRoot(), droot, rules, diags);
  if (rules.numRules(RULE_ORDERING) > 0) {
    _apply_ordering(droot, rules);
  }
  if (rules.numRules(RULE_SECTIONAL_EXITING) > 0) {
    _add_exit_markers(droot, rules);
  }
  TRACE_DISPLAY("remediation has %zu lines", rem->size());
  return rem;
}

CfgTree *
remed::predict(const CfgTree& running, const CfgTree& remediation)
{
  TRACE_INIT("Predicting from %zu running lines", running.size());
  CfgTree *future = new CfgTree();
  _predict_level(running.getRoot(), remediation.getRoot(),
                 future->getRoot());
  TRACE_DISPLAY("future config has %zu lines", future->size());
  return future;
}

CfgTree *
remed::predict_from_target(const CfgTree& running, const CfgTree& target,
                           const RuleSet& rules)
{
  unique_ptr<CfgTree> rem(compare(running, target, rules));
  return predict(running, *rem);
}

CfgTree *
remed::rollback(const CfgTree& future, const CfgTree& running,
                const RuleSet& rules, vector<Error> *diags)
{
  return compare(future, running, rules, diags);
}

CfgTree *
remed::predict_steps(const CfgTree& running,
                     const vector<const CfgTree *>& targets,
                     const RuleSet& rules, vector<CfgTree *>& remediations)
{
  TRACE_INIT("Planning %zu steps", targets.size());
  unique_ptr<CfgTree> cur(running.clone());
  for (size_t i = 0; i < targets.size(); i++) {
    CfgTree *rem = compare(*cur, *(targets[i]), rules);
    remediations.push_back(rem);
    cur.reset(predict(*cur, *rem));
  }
  TRACE_DISPLAY("planned %zu steps", targets.size());
  return cur.release();
}

CfgTree *
remed::difference(const CfgTree& cfg1, const CfgTree& cfg2,
                  const RuleSet& rules)
{
  CfgTree *diff = new CfgTree();
  _difference(cfg1.getRoot(), cfg2.getRoot(), diff->getRoot(),
              rules.getOptions().negation_prefix);
  return diff;
}

size_t
remed::count_remed_ops(const CfgTree& remediation, RemedOp op)
{
  size_t count = 0;
  PreorderRange<CfgNode> nodes = remediation.allNodes();
  for (PreorderRange<CfgNode>::iterator it = nodes.begin();
       it != nodes.end(); ++it) {
    if (it->getRemedOp() == op && !it->isSectionalExit()) {
      ++count;
    }
  }
  return count;
}
