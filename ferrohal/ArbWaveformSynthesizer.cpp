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
	@brief Implementation of ArbWaveformSynthesizer
 */

#include "ferrohal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Input checking

/**
	@brief Verifies there are at least two breakpoints, all at finite non-negative x, strictly increasing
 */
void ArbWaveformSynthesizer::ValidateBreakpoints(const BreakpointList& breakpoints)
{
	if(breakpoints.size() < 2)
	{
		throw InvalidBreakpointsError(
			"Need at least two breakpoints, got " + to_string(breakpoints.size()));
	}

	for(size_t i=0; i<breakpoints.size(); i++)
	{
		auto& p = breakpoints[i];
		if(!std::isfinite(p.x) || !std::isfinite(p.y))
			throw InvalidBreakpointsError("Breakpoint " + to_string(i) + " is not finite");
		if(p.x < 0)
			throw InvalidBreakpointsError("Breakpoint " + to_string(i) + " has negative time");
		if( (i > 0) && (p.x <= breakpoints[i-1].x) )
		{
			char tmp[128];
			snprintf(tmp, sizeof(tmp), "Breakpoint %zu (x=%g) does not come after breakpoint %zu (x=%g)",
				i, p.x, i-1, breakpoints[i-1].x);
			throw InvalidBreakpointsError(tmp);
		}
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Synthesis

/**
	@brief Linearly interpolates breakpoints onto exactly totalPoints evenly spaced samples

	Each segment gets round(totalPoints * width / x_last) samples, starting at its left breakpoint and stopping
	short of its right one. Rounding can leave the table short, in which case the last sample is repeated, or long,
	in which case the tail is cut off.
 */
vector<double> ArbWaveformSynthesizer::Densify(const BreakpointList& breakpoints, size_t totalPoints)
{
	ValidateBreakpoints(breakpoints);
	if(totalPoints < breakpoints.size())
	{
		throw InvalidBreakpointsError(
			"Cannot fit " + to_string(breakpoints.size()) + " breakpoints into " + to_string(totalPoints) + " points");
	}

	double xlast = breakpoints.back().x;

	vector<double> ret;
	ret.reserve(totalPoints);
	for(size_t i=0; i+1 < breakpoints.size(); i++)
	{
		auto& left = breakpoints[i];
		auto& right = breakpoints[i+1];

		size_t n = lround(totalPoints * (right.x - left.x) / xlast);
		double step = (right.y - left.y) / n;
		for(size_t j=0; j<n; j++)
			ret.push_back(left.y + step*j);
	}

	if(ret.size() > totalPoints)
	{
		LogTrace("Truncating %zu samples to %zu\n", ret.size(), totalPoints);
		ret.resize(totalPoints);
	}
	else if(ret.size() < totalPoints)
	{
		LogTrace("Padding %zu samples to %zu\n", ret.size(), totalPoints);
		double last = ret.empty() ? breakpoints.back().y : ret.back();
		ret.resize(totalPoints, last);
	}

	return ret;
}

/**
	@brief Maps samples linearly so the minimum becomes -fullScaleCode and the maximum +fullScaleCode

	@throws DegenerateRangeError if there are no samples or they are all equal
 */
vector<double> ArbWaveformSynthesizer::ScaleToDeviceCodes(const vector<double>& samples, double fullScaleCode)
{
	if(samples.empty())
		throw DegenerateRangeError("Cannot scale an empty waveform");

	double vmin = samples[0];
	double vmax = samples[0];
	for(auto v : samples)
	{
		vmin = min(vmin, v);
		vmax = max(vmax, v);
	}

	double range = vmax - vmin;
	if(range == 0)
	{
		char tmp[128];
		snprintf(tmp, sizeof(tmp), "All %zu samples are %g, cannot normalize", samples.size(), vmin);
		throw DegenerateRangeError(tmp);
	}

	vector<double> ret(samples.size());
	for(size_t i=0; i<samples.size(); i++)
		ret[i] = (2*(samples[i] - vmin) / range - 1) * fullScaleCode;
	return ret;
}
