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
	@brief Declaration of AcquisitionSession
 */

#ifndef AcquisitionSession_h
#define AcquisitionSession_h

///@brief Where a captured trace came from
struct TraceMetadata
{
	std::string typeTag;

	///@brief Length of one playback of the stimulus, in seconds
	double nominalDuration;

	///@brief Name the stimulus was played under on the generator
	std::string waveformName;

	///@brief True if the stimulus was copied to non-volatile memory
	bool stored;
};

///@brief A decoded capture plus the context needed to interpret it
struct AcquisitionResult
{
	Trace trace;
	TraceMetadata metadata;
	WaveformPreamble preamble;
};

/**
	@brief Applies one stimulus with a generator and captures the response with a scope

	The session has exclusive use of both instruments while it exists. Any error aborts the run: nothing is retried
	and no partial result is returned.
 */
class AcquisitionSession
{
public:
	AcquisitionSession(FunctionGenerator& gen, Oscilloscope& scope, const SessionConfig& config);
	virtual ~AcquisitionSession();

	//not copyable or assignable
	AcquisitionSession(const AcquisitionSession& rhs) =delete;
	AcquisitionSession& operator=(const AcquisitionSession& rhs) =delete;

	enum Step
	{
		STEP_INITIALIZE,
		STEP_SYNTHESIZE,
		STEP_CONFIGURE_GENERATOR,
		STEP_CONFIGURE_SCOPE,
		STEP_TRIGGER,
		STEP_FETCH,
		STEP_PACKAGE
	};

	static std::string GetNameOfStep(Step step);

	AcquisitionResult Run(const MeasurementWaveform& waveform);

	///@brief Emitted at the start of each step of Run()
	sigc::signal<void(Step)> signal_stepStarted()
	{ return m_stepStartedSignal; }

protected:
	void StartStep(Step step);

	void ConfigureGenerator(ArbWaveformSequence& seq, const MeasurementWaveform& waveform);
	void ConfigureScope(const MeasurementWaveform& waveform);

	FunctionGenerator& m_generator;
	Oscilloscope& m_scope;
	SessionConfig m_config;

	sigc::signal<void(Step)> m_stepStartedSignal;
};

#endif
