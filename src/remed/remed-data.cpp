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

#include <vector>
#include <string>

#include <remed/remed-data.hpp>

using namespace remed;
using namespace std;

////// class RemedData
RemedData::RemedData()
  : _remed_op(REMED_NONE), _remed_origin(0), _new_in_config(false),
    _sectional_exit(false), _force_duplicate(false)
{
}

void
RemedData::setRemedOp(RemedOp op)
{
  _remed_op = op;
}

void
RemedData::setRemedOrigin(const ctree::CfgNode *origin)
{
  _remed_origin = origin;
}

void
RemedData::addSourceText(const string& text)
{
  _source_texts.push_back(text);
}

void
RemedData::setSupersededText(const string& text)
{
  _superseded_text = text;
}

void
RemedData::setNewInConfig(bool nic)
{
  _new_in_config = nic;
}

void
RemedData::setSectionalExit(bool se)
{
  _sectional_exit = se;
}

void
RemedData::setForceDuplicate(bool fd)
{
  _force_duplicate = fd;
}

void
RemedData::copyRemedData(const RemedData& other)
{
  _remed_op = other._remed_op;
  _remed_origin = other._remed_origin;
  _source_texts = other._source_texts;
  _superseded_text = other._superseded_text;
  _new_in_config = other._new_in_config;
  _sectional_exit = other._sectional_exit;
  _force_duplicate = other._force_duplicate;
}

void
RemedData::clearRemedData()
{
  copyRemedData(RemedData());
}

RemedOp
RemedData::getRemedOp() const
{
  return _remed_op;
}

const ctree::CfgNode *
RemedData::getRemedOrigin() const
{
  return _remed_origin;
}

const vector<string>&
RemedData::getSourceTexts() const
{
  return _source_texts;
}

const string&
RemedData::getSupersededText() const
{
  return _superseded_text;
}

bool
RemedData::supersedes() const
{
  return !_superseded_text.empty();
}

bool
RemedData::isNewInConfig() const
{
  return _new_in_config;
}

bool
RemedData::isSectionalExit() const
{
  return _sectional_exit;
}

bool
RemedData::isForceDuplicate() const
{
  return _force_duplicate;
}
