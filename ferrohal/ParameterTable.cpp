/***********************************************************************************************************************
*                                                                                                                      *
* libferrohal                                                                                                          *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@brief Implementation of ParameterTable
 */

#include "ferrohal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

ParameterTable::ParameterTable()
{
}

void ParameterTable::AddRange(const string& name, double min, double max)
{
	if(min > max)
		swap(min, max);
	m_constraints[name] = ParameterRange{min, max};
}

void ParameterTable::AddChoices(const string& name, const set<string>& allowed)
{
	ParameterChoices choices;
	for(auto& s : allowed)
		choices.allowed.emplace(strtolower(s));
	m_constraints[name] = choices;
}

const ParameterConstraint& ParameterTable::GetConstraint(const string& name) const
{
	auto it = m_constraints.find(name);
	if(it == m_constraints.end())
		throw ConfigurationError("No constraint declared for parameter \"" + name + "\"");
	return it->second;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Validation

/**
	@brief Checks a numeric value against the constraint declared for a parameter

	A value checked against a set of choices is compared in its shortest decimal form, so channel number 2 matches
	the choice "2".
 */
void ParameterTable::Validate(const string& name, double value) const
{
	auto it = m_constraints.find(name);
	if(it == m_constraints.end())
		return;

	if(auto range = get_if<ParameterRange>(&it->second))
	{
		if(std::isnan(value) || (value < range->min) || (value > range->max))
		{
			char tmp[256];
			snprintf(tmp, sizeof(tmp), "%s = %g is outside the allowed range [%g, %g]",
				name.c_str(), value, range->min, range->max);
			throw ParameterOutOfRangeError(name, tmp);
		}
		return;
	}

	char tmp[64];
	if( (value == floor(value)) && (fabs(value) < 1e15) )
		snprintf(tmp, sizeof(tmp), "%lld", static_cast<long long>(value));
	else
		snprintf(tmp, sizeof(tmp), "%g", value);
	Validate(name, string(tmp));
}

/**
	@brief Checks a string value against the constraint declared for a parameter

	A string checked against a numeric range must parse as a number in its entirety.
 */
void ParameterTable::Validate(const string& name, const string& value) const
{
	auto it = m_constraints.find(name);
	if(it == m_constraints.end())
		return;

	if(auto choices = get_if<ParameterChoices>(&it->second))
	{
		if(choices->allowed.find(strtolower(Trim(value))) == choices->allowed.end())
		{
			string allowed;
			for(auto& s : choices->allowed)
			{
				if(!allowed.empty())
					allowed += ", ";
				allowed += s;
			}
			throw ParameterNotInSetError(name, name + " = \"" + value + "\" is not one of {" + allowed + "}");
		}
		return;
	}

	string trimmed = Trim(value);
	char* end = nullptr;
	double d = strtod(trimmed.c_str(), &end);
	if(trimmed.empty() || (*end != '\0'))
		throw ParameterOutOfRangeError(name, name + " = \"" + value + "\" is not numeric");
	Validate(name, d);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

/**
	@brief Overrides table entries from a YAML map

	Each key is a parameter name mapping to either {range: [min, max]} or {list: [a, b, ...]}.
 */
void ParameterTable::LoadConfiguration(const YAML::Node& node)
{
	if(!node)
		return;
	if(!node.IsMap())
		throw ConfigurationError("Parameter limits must be a map");

	for(auto it : node)
	{
		auto name = it.first.as<string>();
		auto& value = it.second;
		if(!value.IsMap())
			throw ConfigurationError("Limits for \"" + name + "\" must be a map with a range or list key");

		if(value["range"])
		{
			auto range = value["range"];
			double lo;
			double hi;
			if( !range.IsSequence() || (range.size() != 2) ||
				!YAML::convert<double>::decode(range[0], lo) ||
				!YAML::convert<double>::decode(range[1], hi) )
			{
				throw ConfigurationError("Range for \"" + name + "\" must be a list of two numbers");
			}

			LogTrace("%s: range [%g, %g]\n", name.c_str(), lo, hi);
			AddRange(name, lo, hi);
		}
		else if(value["list"])
		{
			auto list = value["list"];
			if(!list.IsSequence() || (list.size() == 0))
				throw ConfigurationError("List for \"" + name + "\" must be a non-empty sequence");

			set<string> allowed;
			for(auto v : list)
				allowed.emplace(v.as<string>());
			LogTrace("%s: %zu choices\n", name.c_str(), allowed.size());
			AddChoices(name, allowed);
		}
		else
			throw ConfigurationError("Limits for \"" + name + "\" need a range or list key");
	}
}
