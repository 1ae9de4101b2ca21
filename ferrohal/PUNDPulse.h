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
	@brief Declaration of PUNDPulse
 */

#ifndef PUNDPulse_h
#define PUNDPulse_h

/**
	@brief Positive-Up-Negative-Down pulse train for separating switching from non-switching polarization

	A reset pulse of the opposite polarity is followed by two identical pulses (P and U), each followed by a delay
	at zero volts. The polarity of P and U is the sign of their amplitude. The reset pulse always has the opposite
	sign, whatever the sign of its own amplitude.
 */
class PUNDPulse : public MeasurementWaveform
{
public:
	struct Parameters
	{
		double resetAmplitude = 1;
		double resetWidth = 1e-3;
		double resetDelay = 1e-3;
		double puAmplitude = 1;
		double puWidth = 1e-3;
		double puDelay = 1e-3;
		double offset = 0;
	};

	PUNDPulse(const Parameters& params);

	virtual double GetDuration() const override;
	virtual size_t GetBreakpointCount() const override;
	virtual BreakpointList GetBreakpoints(size_t totalPoints) const override;

	///@brief +1 if P and U are positive pulses, -1 if negative
	int GetPolarity() const
	{ return (m_params.puAmplitude < 0) ? -1 : 1; }

protected:
	Parameters m_params;
};

#endif
