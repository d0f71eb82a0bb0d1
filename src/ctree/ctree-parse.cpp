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

#include <common/util.hpp>
#include <common/output.hpp>
#include <common/fsutil.hpp>
#include <crule/crule.hpp>
#include <ctree/ctree.hpp>
#include <ctree/ctree-parse.hpp>

using namespace ctree;
using namespace hcfg;
using namespace std;

// spaces per block level in curly-brace text
static const size_t C_BRACE_INDENT = 4;

static size_t
leading_ws(const string& line)
{
  size_t i = 0;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
    ++i;
  }
  return i;
}

static bool
is_skipped_line(const string& text, size_t indent)
{
  if (text.empty() || text[0] == '!') {
    return true;
  }
  return (indent == 0 && text == "end");
}

// exit line of the section it would be added to
static bool
is_sectional_exit(const CfgNode *parent, const string& text,
                  const crule::RuleSet *rules)
{
  if (!rules || !parent || parent->isRoot()) {
    return false;
  }
  const crule::Rule *r = rules->resolve(*parent,
                                        crule::RULE_SECTIONAL_EXITING);
  return (r && r->getExitText() == text);
}

void
ctree::split_lines(const string& text, vector<string>& lines)
{
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == string::npos) {
      if (start < text.size()) {
        lines.push_back(text.substr(start));
      }
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
}

// any "name {" line makes the text curly-brace syntax
static bool
has_brace_blocks(const vector<string>& lines)
{
  for (size_t i = 0; i < lines.size(); i++) {
    if (str_endswith(str_strip(lines[i]), "{")) {
      return true;
    }
  }
  return false;
}

void
ctree::convert_to_set_commands(const vector<string>& lines,
                               vector<string>& commands,
                               const string& declaration,
                               const string& negation)
{
  // enclosing block names, outermost first
  vector<string> path;
  for (size_t i = 0; i < lines.size(); i++) {
    string text = str_strip(lines[i]);
    if (text.empty()) {
      continue;
    }
    size_t level = leading_ws(lines[i]) / C_BRACE_INDENT;
    if (path.size() > level) {
      path.resize(level);
    }
    if (str_endswith(text, ";")) {
      text = str_strip(text.substr(0, text.size() - 1));
    }
    if (text == "}") {
      continue;
    }
    if (str_endswith(text, "{")) {
      path.push_back(str_strip(text.substr(0, text.size() - 1)));
      continue;
    }
    if ((!declaration.empty() && str_startswith(text, declaration))
        || (!negation.empty() && str_startswith(text, negation))) {
      commands.push_back(text);
      continue;
    }
    string cmd = declaration;
    for (size_t j = 0; j < path.size(); j++) {
      cmd += path[j] + " ";
    }
    commands.push_back(cmd + text);
  }
}

CfgTree *
ctree::parse_lines(const vector<string>& lines, const crule::RuleSet *rules,
                   Error& err)
{
  if (rules && !rules->getOptions().declaration_prefix.empty()
      && has_brace_blocks(lines)) {
    const crule::DriverOptions& opts = rules->getOptions();
    vector<string> cmds;
    convert_to_set_commands(lines, cmds, opts.declaration_prefix,
                            opts.negation_prefix);
    return parse_lines(cmds, rules, err);
  }

  unique_ptr<CfgTree> tree(new CfgTree());
  // indentation of each open section, outermost first
  vector<size_t> indents;

  for (size_t i = 0; i < lines.size(); i++) {
    size_t indent = leading_ws(lines[i]);
    string text = str_strip(lines[i]);
    if (is_skipped_line(text, indent)) {
      continue;
    }
    while (!indents.empty() && indents.back() >= indent) {
      indents.pop_back();
    }
    size_t depth = indents.size() + 1;

    CfgNode *parent = tree->getOpenSection(depth);
    if (is_sectional_exit(parent, text, rules)) {
      continue;
    }
    bool dup = (rules && parent && rules->duplicateChildAllowed(*parent));
    if (!tree->appendLine(depth, text, err, dup)) {
      output_internal("parse failed at line %zu: %s\n", i + 1,
                      err.getMessage().c_str());
      return NULL;
    }
    indents.push_back(indent);
  }
  return tree.release();
}

CfgTree *
ctree::parse_text(const string& text, const crule::RuleSet *rules,
                  Error& err)
{
  vector<string> lines;
  split_lines(text, lines);
  return parse_lines(lines, rules, err);
}

CfgTree *
ctree::parse_file(const string& path, const crule::RuleSet *rules,
                  Error& err)
{
  string data, why;
  if (!read_whole_file(path, data, why)) {
    err.set(ERR_CONFIG_FILE, "cannot read config [%s]: %s", path.c_str(),
            why.c_str());
    return NULL;
  }
  return parse_text(data, rules, err);
}
