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
	@brief Implementation of SessionConfig
 */

#include "ferrohal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SessionConfig::SessionConfig()
	: m_settleTime(200)
	, m_generatorChannel(1)
	, m_sourceImpedance(50)
	, m_loadImpedance(50)
	, m_generatorTriggerSource("MAN")
	, m_scopeChannel(1)
	, m_voltageScale(0.01)
	, m_channelImpedance("FIFT")
	, m_timebaseMargin(1)
	, m_triggerSource("EXT")
	, m_triggerLow(0.75)
	, m_triggerHigh(0.95)
	, m_triggerSweep("NORM")
	, m_triggerCoupling("DC")
	, m_triggerSlope("POS")
	, m_transferFormat(WaveformPreamble::FORMAT_BYTE)
	, m_byteOrder(RawSampleBuffer::BYTE_ORDER_MSB_FIRST)
	, m_signedness(RawSampleBuffer::SAMPLES_SIGNED)
	, m_outputPath("waveform.csv")
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

/**
	@brief Overrides defaults from a session: node. Keys not present keep their defaults.
 */
void SessionConfig::LoadConfiguration(const YAML::Node& node)
{
	if(!node)
		return;
	if(!node.IsMap())
		throw ConfigurationError("Session settings must be a map");

	int64_t settle = m_settleTime.count();
	LoadConfigValue(node, "settle_time_ms", settle);
	if(settle < 0)
		throw ConfigurationError("settle_time_ms cannot be negative");
	m_settleTime = chrono::milliseconds(settle);

	LoadConfigValue(node, "generator_channel", m_generatorChannel);
	LoadConfigValue(node, "source_impedance", m_sourceImpedance);
	LoadConfigValue(node, "load_impedance", m_loadImpedance);
	LoadConfigValue(node, "generator_trigger_source", m_generatorTriggerSource);

	LoadConfigValue(node, "scope_channel", m_scopeChannel);
	LoadConfigValue(node, "voltage_scale", m_voltageScale);
	LoadConfigValue(node, "channel_impedance", m_channelImpedance);
	LoadConfigValue(node, "timebase_margin", m_timebaseMargin);
	if(!(m_timebaseMargin > 0))
		throw ConfigurationError("timebase_margin must be positive");

	LoadConfigValue(node, "trigger_source", m_triggerSource);
	LoadConfigValue(node, "trigger_low", m_triggerLow);
	LoadConfigValue(node, "trigger_high", m_triggerHigh);
	LoadConfigValue(node, "trigger_sweep", m_triggerSweep);
	LoadConfigValue(node, "trigger_coupling", m_triggerCoupling);
	LoadConfigValue(node, "trigger_slope", m_triggerSlope);

	if(node["format"])
	{
		auto fmt = strtolower(node["format"].as<string>());
		if(fmt == "byte")
			m_transferFormat = WaveformPreamble::FORMAT_BYTE;
		else if(fmt == "word")
			m_transferFormat = WaveformPreamble::FORMAT_WORD;
		else if( (fmt == "ascii") || (fmt == "asc") )
			m_transferFormat = WaveformPreamble::FORMAT_ASCII;
		else
			throw ConfigurationError("Unknown waveform transfer format \"" + fmt + "\"");
	}
	if(node["byte_order"])
		m_byteOrder = RawSampleBuffer::GetByteOrderOfName(node["byte_order"].as<string>());
	if(node["signedness"])
		m_signedness = RawSampleBuffer::GetSignednessOfName(node["signedness"].as<string>());

	LoadConfigValue(node, "output", m_outputPath);
}
