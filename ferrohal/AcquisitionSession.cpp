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
	@brief Implementation of AcquisitionSession
 */

#include "ferrohal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

AcquisitionSession::AcquisitionSession(FunctionGenerator& gen, Oscilloscope& scope, const SessionConfig& config)
	: m_generator(gen)
	, m_scope(scope)
	, m_config(config)
{
}

AcquisitionSession::~AcquisitionSession()
{
}

string AcquisitionSession::GetNameOfStep(Step step)
{
	switch(step)
	{
		case STEP_INITIALIZE:				return "Initialize instruments";
		case STEP_SYNTHESIZE:				return "Synthesize stimulus";
		case STEP_CONFIGURE_GENERATOR:		return "Configure generator";
		case STEP_CONFIGURE_SCOPE:			return "Configure oscilloscope";
		case STEP_TRIGGER:					return "Trigger";
		case STEP_FETCH:					return "Fetch and decode";
		case STEP_PACKAGE:					return "Package trace";

		default:
			return "Unknown";
	}
}

void AcquisitionSession::StartStep(Step step)
{
	LogVerbose("%s\n", GetNameOfStep(step).c_str());
	m_stepStartedSignal.emit(step);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// The acquisition itself

/**
	@brief Plays the stimulus once and returns the captured response
 */
AcquisitionResult AcquisitionSession::Run(const MeasurementWaveform& waveform)
{
	LogNotice("Capturing %s waveform (%e s)\n", waveform.GetTypeTag().c_str(), waveform.GetDuration());
	LogIndenter li;

	StartStep(STEP_INITIALIZE);
	m_generator.Initialize();
	m_scope.Initialize();

	StartStep(STEP_SYNTHESIZE);
	ArbWaveformSequence seq;
	size_t npoints = waveform.GetTotalPoints(m_generator);
	seq.SetBreakpoints(waveform.GetBreakpoints(npoints));
	seq.Densify(npoints);
	seq.Scale(m_generator.GetArbFullScaleCode());
	LogDebug("%zu point table\n", npoints);

	StartStep(STEP_CONFIGURE_GENERATOR);
	ConfigureGenerator(seq, waveform);

	StartStep(STEP_CONFIGURE_SCOPE);
	ConfigureScope(waveform);

	StartStep(STEP_TRIGGER);
	m_scope.InitiateAcquisition();
	m_generator.SendSoftwareTrigger();
	this_thread::sleep_for(m_config.m_settleTime);

	StartStep(STEP_FETCH);
	auto preamble = WaveformPreamble::Parse(m_scope.QueryPreamble());
	auto samples = m_scope.QueryWaveformData();
	auto trace = WaveformDecoder::Decode(preamble, samples, m_config.m_byteOrder, m_config.m_signedness);

	StartStep(STEP_PACKAGE);
	TraceMetadata meta;
	meta.typeTag = waveform.GetTypeTag();
	meta.nominalDuration = waveform.GetDuration();
	meta.waveformName = seq.GetWaveformName();
	meta.stored = seq.IsStored();

	LogVerbose("Captured %zu samples\n", trace.size());
	return AcquisitionResult{std::move(trace), meta, preamble};
}

/**
	@brief Loads the table into the generator and sets it up to play one burst per software trigger
 */
void AcquisitionSession::ConfigureGenerator(ArbWaveformSequence& seq, const MeasurementWaveform& waveform)
{
	int chan = m_config.m_generatorChannel;

	seq.Upload(m_generator, chan);
	seq.Store(m_generator, chan, waveform.GetWaveformName());
	seq.ConfigureOnChannel(m_generator, chan, waveform.GetGain(), waveform.GetOffset(), waveform.GetFrequency());

	m_generator.CoupleChannels();
	m_generator.ConfigureImpedance(chan, m_config.m_sourceImpedance, m_config.m_loadImpedance);
	m_generator.ConfigureTrigger(chan, m_config.m_generatorTriggerSource);
	m_generator.SetOutputEnabled(chan, true);
}

/**
	@brief Sets the capture window so the whole stimulus fits on screen, starting at the trigger
 */
void AcquisitionSession::ConfigureScope(const MeasurementWaveform& waveform)
{
	//Ten horizontal divisions, trigger at the left edge
	TimebaseSettings timebase;
	timebase.mode = "MAIN";
	timebase.reference = "CENTer";
	timebase.scale = waveform.GetDuration() * m_config.m_timebaseMargin / 10;
	timebase.position = 5 * (*timebase.scale);
	m_scope.ConfigureTimebase(timebase);

	ChannelSettings channel;
	channel.channel = m_config.m_scopeChannel;
	channel.scale = m_config.m_voltageScale;
	channel.impedance = m_config.m_channelImpedance;
	m_scope.ConfigureChannel(channel);

	m_scope.SetAcquisitionType(WaveformPreamble::TYPE_NORMAL);
	m_scope.ConfigureTriggerCharacteristics(
		m_config.m_triggerSource,
		m_config.m_triggerLow,
		m_config.m_triggerHigh,
		m_config.m_triggerSweep);
	m_scope.ConfigureTriggerEdge(m_config.m_triggerSource, m_config.m_triggerCoupling, m_config.m_triggerSlope);
	m_scope.ConfigureWaveformTransfer(
		m_config.m_scopeChannel,
		m_config.m_transferFormat,
		m_config.m_byteOrder,
		m_config.m_signedness);
}
