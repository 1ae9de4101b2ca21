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
	@brief Implementation of PUNDPulse
 */

#include "ferrohal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

PUNDPulse::PUNDPulse(const Parameters& params)
	: MeasurementWaveform("PUND", params.offset)
	, m_params(params)
{
	if(!(params.resetWidth > 0) || !(params.resetDelay > 0) || !(params.puWidth > 0) || !(params.puDelay > 0))
		throw ParameterOutOfRangeError("width", "PUND pulse widths and delays must be positive");
	if( (params.puAmplitude == 0) || !std::isfinite(params.puAmplitude) || !std::isfinite(params.resetAmplitude) )
		throw ParameterOutOfRangeError("pu_amplitude", "PUND P/U amplitude must be finite and nonzero");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Waveform shape

double PUNDPulse::GetDuration() const
{
	return m_params.resetWidth + m_params.resetDelay + 2*m_params.puWidth + 2*m_params.puDelay;
}

size_t PUNDPulse::GetBreakpointCount() const
{
	return 12;
}

/**
	@brief Builds the pulse train with every edge one table point long

	Pulses and delays shorter than one point make the breakpoints non-monotonic, which Densify() rejects.
 */
BreakpointList PUNDPulse::GetBreakpoints(size_t totalPoints) const
{
	double edge = GetDuration() / totalPoints;
	double vreset = -GetPolarity() * fabs(m_params.resetAmplitude);
	double vpulse = GetPolarity() * fabs(m_params.puAmplitude);

	BreakpointList ret;
	double t = 0;

	//Reset
	ret.push_back(Breakpoint{t, vreset});
	t += m_params.resetWidth;
	ret.push_back(Breakpoint{t, vreset});
	ret.push_back(Breakpoint{t + edge, 0});
	t += m_params.resetDelay;
	ret.push_back(Breakpoint{t, 0});

	//P, then U
	for(int i=0; i<2; i++)
	{
		ret.push_back(Breakpoint{t + edge, vpulse});
		t += m_params.puWidth;
		ret.push_back(Breakpoint{t, vpulse});
		ret.push_back(Breakpoint{t + edge, 0});
		t += m_params.puDelay;
		ret.push_back(Breakpoint{t, 0});
	}

	return ret;
}
