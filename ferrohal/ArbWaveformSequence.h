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
	@brief Declaration of ArbWaveformSequence
 */

#ifndef ArbWaveformSequence_h
#define ArbWaveformSequence_h

/**
	@brief Tracks one arbitrary waveform from breakpoints to a configured generator channel

	Each step may only be taken from the state the previous step left behind:

	Idle -> BreakpointsComputed -> Densified -> Scaled -> UploadedVolatile -> [Named] -> ConfiguredOnChannel

	Naming is optional. If the generator has no free non-volatile slot the waveform stays volatile, and the channel
	is configured to play the volatile copy.
 */
class ArbWaveformSequence
{
public:
	enum State
	{
		STATE_IDLE,
		STATE_BREAKPOINTS_COMPUTED,
		STATE_DENSIFIED,
		STATE_SCALED,
		STATE_UPLOADED_VOLATILE,
		STATE_NAMED,
		STATE_CONFIGURED_ON_CHANNEL
	};

	ArbWaveformSequence();

	//not copyable or assignable
	ArbWaveformSequence(const ArbWaveformSequence& rhs) =delete;
	ArbWaveformSequence& operator=(const ArbWaveformSequence& rhs) =delete;

	void SetBreakpoints(const BreakpointList& breakpoints);
	void Densify(size_t totalPoints);
	void Scale(double fullScaleCode);
	void Upload(FunctionGenerator& gen, int chan);
	bool Store(FunctionGenerator& gen, int chan, const std::string& name);
	void ConfigureOnChannel(FunctionGenerator& gen, int chan, double gain, double offset, double freq);

	State GetState() const
	{ return m_state; }

	///@brief True if the waveform was copied to non-volatile memory
	bool IsStored() const
	{ return m_stored; }

	///@brief Name the generator plays the waveform under (empty before upload)
	const std::string& GetWaveformName() const
	{ return m_name; }

	static std::string GetNameOfState(State state);

protected:
	void RequireState(State expected, const char* operation) const;

	State m_state;

	BreakpointList m_breakpoints;

	///@brief Dense table: volts-like units after Densify(), device codes after Scale()
	std::vector<double> m_samples;

	std::string m_name;
	bool m_stored;
};

#endif
