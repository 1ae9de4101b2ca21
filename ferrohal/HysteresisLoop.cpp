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
	@brief Implementation of HysteresisLoop
 */

#include "ferrohal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@param frequency	Frequency of one triangle, in Hz
	@param amplitude	Peak voltage
	@param offset		DC offset, in volts
	@param cycles		Number of triangles
 */
HysteresisLoop::HysteresisLoop(double frequency, double amplitude, double offset, unsigned int cycles)
	: MeasurementWaveform("HYSTERESIS", offset)
	, m_frequency(frequency)
	, m_amplitude(fabs(amplitude))
	, m_cycles(cycles)
{
	if(!(frequency > 0) || !std::isfinite(frequency))
		throw ParameterOutOfRangeError("frequency", "Hysteresis frequency must be positive");
	if(!(m_amplitude > 0) || !std::isfinite(m_amplitude))
		throw ParameterOutOfRangeError("amplitude", "Hysteresis amplitude must be nonzero");
	if(cycles < 1)
		throw ParameterOutOfRangeError("cycles", "Hysteresis loop needs at least one cycle");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Waveform shape

double HysteresisLoop::GetDuration() const
{
	return m_cycles / m_frequency;
}

size_t HysteresisLoop::GetBreakpointCount() const
{
	return 4*m_cycles + 1;
}

BreakpointList HysteresisLoop::GetBreakpoints(size_t /*totalPoints*/) const
{
	static const double shape[4] = {0, 1, 0, -1};
	double quarter = 0.25 / m_frequency;

	BreakpointList ret;
	size_t n = GetBreakpointCount();
	for(size_t i=0; i+1 < n; i++)
		ret.push_back(Breakpoint{i*quarter, shape[i % 4] * m_amplitude});
	ret.push_back(Breakpoint{(n-1)*quarter, 0});
	return ret;
}
