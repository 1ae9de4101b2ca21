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
	@brief Declaration of ParameterTable
 */

#ifndef ParameterTable_h
#define ParameterTable_h

///@brief Inclusive numeric range a parameter must fall within
struct ParameterRange
{
	double min;
	double max;
};

///@brief Set of strings a parameter must be one of (compared case insensitively)
struct ParameterChoices
{
	std::set<std::string> allowed;
};

typedef std::variant<ParameterRange, ParameterChoices> ParameterConstraint;

/**
	@brief Table of declared constraints for the configuration values an instrument accepts

	Drivers check every value against the table before the corresponding command is written. Parameters without an
	entry are not constrained.
 */
class ParameterTable
{
public:
	ParameterTable();

	void AddRange(const std::string& name, double min, double max);
	void AddChoices(const std::string& name, const std::set<std::string>& allowed);

	bool HasParameter(const std::string& name) const
	{ return m_constraints.find(name) != m_constraints.end(); }

	const ParameterConstraint& GetConstraint(const std::string& name) const;

	size_t size() const
	{ return m_constraints.size(); }

	void Validate(const std::string& name, double value) const;
	void Validate(const std::string& name, const std::string& value) const;

	void LoadConfiguration(const YAML::Node& node);

protected:
	std::map<std::string, ParameterConstraint> m_constraints;
};

#endif
