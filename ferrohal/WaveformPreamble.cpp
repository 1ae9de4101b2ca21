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
	@brief Implementation of WaveformPreamble
 */

#include "ferrohal.h"

#include <cerrno>
#include <cmath>

using namespace std;

//Indexes of each field in the preamble record
enum PreambleField
{
	FIELD_FORMAT,
	FIELD_TYPE,
	FIELD_POINTS,
	FIELD_COUNT,
	FIELD_XINCREMENT,
	FIELD_XORIGIN,
	FIELD_XREFERENCE,
	FIELD_YINCREMENT,
	FIELD_YORIGIN,
	FIELD_YREFERENCE,

	FIELD_COUNT_TOTAL
};

static const char* g_fieldNames[FIELD_COUNT_TOTAL] =
{
	"format",
	"type",
	"points",
	"count",
	"xincrement",
	"xorigin",
	"xreference",
	"yincrement",
	"yorigin",
	"yreference"
};

/**
	@brief Parses an integer field, allowing a leading + and surrounding whitespace but nothing else
 */
static int64_t ParseIntegerField(const vector<string>& fields, PreambleField i)
{
	string s = Trim(fields[i]);
	const char* start = s.c_str();
	if(*start == '+')
		start ++;

	char* end = nullptr;
	errno = 0;
	long long v = strtoll(start, &end, 10);
	if( (*start == '\0') || (*end != '\0') || (errno == ERANGE) )
	{
		throw MalformedPreambleError(
			string("Preamble field ") + g_fieldNames[i] + " (\"" + fields[i] + "\") is not an integer");
	}
	return v;
}

static double ParseFloatField(const vector<string>& fields, PreambleField i)
{
	string s = Trim(fields[i]);
	const char* start = s.c_str();
	if(*start == '+')
		start ++;

	char* end = nullptr;
	double v = strtod(start, &end);
	if( (*start == '\0') || (*end != '\0') || !std::isfinite(v) )
	{
		throw MalformedPreambleError(
			string("Preamble field ") + g_fieldNames[i] + " (\"" + fields[i] + "\") is not a number");
	}
	return v;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

WaveformPreamble::WaveformPreamble()
	: m_format(FORMAT_BYTE)
	, m_type(TYPE_NORMAL)
	, m_points(0)
	, m_count(1)
	, m_xincrement(0)
	, m_xorigin(0)
	, m_xreference(0)
	, m_yincrement(0)
	, m_yorigin(0)
	, m_yreference(0)
{
}

/**
	@brief Parses the reply to :WAVeform:PREamble?

	@throws MalformedPreambleError if the record does not have exactly ten numeric fields, announces no points,
	has a non-positive sample interval, or names an unknown acquisition type
 */
WaveformPreamble WaveformPreamble::Parse(const string& text)
{
	auto fields = split_fields(Trim(text), ',');
	if(fields.size() != FIELD_COUNT_TOTAL)
	{
		throw MalformedPreambleError(
			"Expected 10 preamble fields, got " + to_string(fields.size()) + " in \"" + text + "\"");
	}

	WaveformPreamble ret;
	ret.m_format = ParseIntegerField(fields, FIELD_FORMAT);

	auto type = ParseIntegerField(fields, FIELD_TYPE);
	if( (type < TYPE_NORMAL) || (type > TYPE_HIRES) )
		throw MalformedPreambleError("Unknown acquisition type " + to_string(type));
	ret.m_type = static_cast<AcquisitionType>(type);

	auto points = ParseIntegerField(fields, FIELD_POINTS);
	if(points < 1)
		throw MalformedPreambleError("Preamble announces " + to_string(points) + " points");
	ret.m_points = points;

	ret.m_count = ParseIntegerField(fields, FIELD_COUNT);

	ret.m_xincrement = ParseFloatField(fields, FIELD_XINCREMENT);
	if(ret.m_xincrement <= 0)
		throw MalformedPreambleError("Preamble x increment must be positive");

	ret.m_xorigin = ParseFloatField(fields, FIELD_XORIGIN);
	ret.m_xreference = ParseIntegerField(fields, FIELD_XREFERENCE);
	ret.m_yincrement = ParseFloatField(fields, FIELD_YINCREMENT);
	ret.m_yorigin = ParseFloatField(fields, FIELD_YORIGIN);
	ret.m_yreference = ParseIntegerField(fields, FIELD_YREFERENCE);

	LogTrace("Preamble: format %d, type %d, %zu points, xinc %e, xorg %e, yinc %e, yorg %e\n",
		ret.m_format, (int)ret.m_type, ret.m_points, ret.m_xincrement, ret.m_xorigin,
		ret.m_yincrement, ret.m_yorigin);

	return ret;
}

string WaveformPreamble::GetNameOfFormat(int format)
{
	switch(format)
	{
		case FORMAT_BYTE:
			return "BYTE";

		case FORMAT_WORD:
			return "WORD";

		case FORMAT_ASCII:
			return "ASCii";

		default:
			return to_string(format);
	}
}
