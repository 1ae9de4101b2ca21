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
	@brief Implementation of ArbWaveformSequence
 */

#include "ferrohal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

ArbWaveformSequence::ArbWaveformSequence()
	: m_state(STATE_IDLE)
	, m_stored(false)
{
}

string ArbWaveformSequence::GetNameOfState(State state)
{
	switch(state)
	{
		case STATE_IDLE:					return "Idle";
		case STATE_BREAKPOINTS_COMPUTED:	return "BreakpointsComputed";
		case STATE_DENSIFIED:				return "Densified";
		case STATE_SCALED:					return "Scaled";
		case STATE_UPLOADED_VOLATILE:		return "UploadedVolatile";
		case STATE_NAMED:					return "Named";
		case STATE_CONFIGURED_ON_CHANNEL:	return "ConfiguredOnChannel";

		default:
			return "Unknown";
	}
}

void ArbWaveformSequence::RequireState(State expected, const char* operation) const
{
	if(m_state != expected)
	{
		throw SequenceStateError(
			string(operation) + " requires state " + GetNameOfState(expected) +
			" but the waveform is " + GetNameOfState(m_state));
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transitions

void ArbWaveformSequence::SetBreakpoints(const BreakpointList& breakpoints)
{
	RequireState(STATE_IDLE, "SetBreakpoints");

	ArbWaveformSynthesizer::ValidateBreakpoints(breakpoints);
	m_breakpoints = breakpoints;
	m_state = STATE_BREAKPOINTS_COMPUTED;
}

void ArbWaveformSequence::Densify(size_t totalPoints)
{
	RequireState(STATE_BREAKPOINTS_COMPUTED, "Densify");

	m_samples = ArbWaveformSynthesizer::Densify(m_breakpoints, totalPoints);
	m_breakpoints.clear();
	m_state = STATE_DENSIFIED;
}

void ArbWaveformSequence::Scale(double fullScaleCode)
{
	RequireState(STATE_DENSIFIED, "Scale");

	m_samples = ArbWaveformSynthesizer::ScaleToDeviceCodes(m_samples, fullScaleCode);
	m_state = STATE_SCALED;
}

void ArbWaveformSequence::Upload(FunctionGenerator& gen, int chan)
{
	RequireState(STATE_SCALED, "Upload");

	gen.UploadArbitraryWaveform(chan, m_samples);
	m_name = gen.GetVolatileWaveformName();
	m_state = STATE_UPLOADED_VOLATILE;
}

/**
	@brief Tries to copy the uploaded waveform to non-volatile memory

	Running out of slots is not an error: the waveform stays volatile and a warning is logged.

	@return True if the waveform was stored
 */
bool ArbWaveformSequence::Store(FunctionGenerator& gen, int chan, const string& name)
{
	RequireState(STATE_UPLOADED_VOLATILE, "Store");

	if(!gen.StoreArbitraryWaveform(chan, name))
	{
		LogWarning("No free non-volatile memory on %s, playing \"%s\" from volatile memory\n",
			gen.GetName().c_str(), name.c_str());
		return false;
	}

	m_name = name;
	m_stored = true;
	m_state = STATE_NAMED;
	return true;
}

void ArbWaveformSequence::ConfigureOnChannel(FunctionGenerator& gen, int chan, double gain, double offset, double freq)
{
	if( (m_state != STATE_UPLOADED_VOLATILE) && (m_state != STATE_NAMED) )
	{
		throw SequenceStateError(
			"ConfigureOnChannel requires state UploadedVolatile or Named but the waveform is " +
			GetNameOfState(m_state));
	}

	gen.SelectArbitraryWaveform(chan, m_name, gain, offset, freq);
	m_state = STATE_CONFIGURED_ON_CHANNEL;
}
