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
	@brief Implementation of KeysightDSOX3024AOscilloscope
 */

#include "ferrohal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

KeysightDSOX3024AOscilloscope::KeysightDSOX3024AOscilloscope(SCPITransport* transport, const ScopeModelConfig& config)
	: SCPIInstrument(transport, config.limits)
	, m_config(config)
	, m_transferFormat(WaveformPreamble::FORMAT_BYTE)
{
	if(m_model != m_config.model)
	{
		LogWarning("Driver %s is for the %s but the instrument identifies as \"%s\"\n",
			GetDriverNameInternal().c_str(), m_config.model.c_str(), m_model.c_str());
	}
}

KeysightDSOX3024AOscilloscope::~KeysightDSOX3024AOscilloscope()
{
}

string KeysightDSOX3024AOscilloscope::GetDriverNameInternal()
{
	return "keysight_dsox3024a";
}

ScopeModelConfig KeysightDSOX3024AOscilloscope::GetDefaultModelConfig()
{
	return ScopeModelConfig::DSOX3024A();
}

size_t KeysightDSOX3024AOscilloscope::GetAnalogChannelCount() const
{
	return m_config.channelCount;
}

/**
	@brief Validates a one-based channel number and returns its command prefix
 */
string KeysightDSOX3024AOscilloscope::GetChannelPrefix(int channel)
{
	m_limits.Validate("channel", channel);
	if( (channel < 1) || (static_cast<size_t>(channel) > m_config.channelCount) )
	{
		throw ParameterOutOfRangeError(
			"channel", "Channel " + to_string(channel) + " does not exist on the " + m_config.model);
	}
	return ":CHAN" + to_string(channel);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Configuration

void KeysightDSOX3024AOscilloscope::ConfigureTimebase(const TimebaseSettings& settings)
{
	m_limits.Validate("time_base_type", settings.mode);
	m_limits.Validate("time_reference", settings.reference);
	if(settings.range)
		m_limits.Validate("time_range", *settings.range);
	if(settings.scale)
		m_limits.Validate("time_scale", *settings.scale);

	SendCommand(":TIM:MODE " + settings.mode);
	if(settings.position)
		SendCommand(":TIM:POS " + to_string_sci(*settings.position));
	if(settings.range)
		SendCommand(":TIM:RANG " + to_string_sci(*settings.range));
	SendCommand(":TIM:REF " + settings.reference);
	if(settings.scale)
		SendCommand(":TIM:SCAL " + to_string_sci(*settings.scale));
	SendCommand(string(":TIM:VERN ") + (settings.vernier ? "1" : "0"));
}

/**
	@brief Configures one analog channel

	Probe attenuation is sent before range and scale since the instrument interprets both at the probe tip.
 */
void KeysightDSOX3024AOscilloscope::ConfigureChannel(const ChannelSettings& settings)
{
	auto prefix = GetChannelPrefix(settings.channel);
	m_limits.Validate("channel_coupling", settings.coupling);
	m_limits.Validate("channel_impedance", settings.impedance);
	m_limits.Validate("probe_attenuation", settings.probeAttenuation);
	if(settings.range)
		m_limits.Validate("voltage_range", *settings.range);
	if(settings.scale)
		m_limits.Validate("voltage_scale", *settings.scale);

	SendCommand(prefix + ":DISP " + (settings.enabled ? "ON" : "OFF"));
	SendCommand(prefix + ":PROB " + to_string_sci(settings.probeAttenuation));
	SendCommand(prefix + ":COUP " + settings.coupling);
	SendCommand(prefix + ":IMP " + settings.impedance);
	if(settings.range)
		SendCommand(prefix + ":RANG " + to_string_sci(*settings.range));
	if(settings.scale)
		SendCommand(prefix + ":SCAL " + to_string_sci(*settings.scale));
	if(settings.offset)
		SendCommand(prefix + ":OFFS " + to_string_sci(*settings.offset));
}

void KeysightDSOX3024AOscilloscope::ConfigureTriggerCharacteristics(
	const string& source,
	double low,
	double high,
	const string& sweep)
{
	m_limits.Validate("trigger_source", source);
	m_limits.Validate("trigger_sweep", sweep);
	m_limits.Validate("trigger_level", low);
	m_limits.Validate("trigger_level", high);
	if(low > high)
	{
		char tmp[128];
		snprintf(tmp, sizeof(tmp), "Low trigger level %g is above high trigger level %g", low, high);
		throw ParameterOutOfRangeError("trigger_level", tmp);
	}

	SendCommand(":TRIG:LEV:HIGH " + to_string_sci(high) + "," + source);
	SendCommand(":TRIG:LEV:LOW " + to_string_sci(low) + "," + source);
	SendCommand(":TRIG:SWE " + sweep);
}

void KeysightDSOX3024AOscilloscope::ConfigureTriggerEdge(
	const string& source,
	const string& coupling,
	const string& slope,
	optional<double> level)
{
	m_limits.Validate("trigger_source", source);
	m_limits.Validate("trigger_coupling", coupling);
	m_limits.Validate("trigger_slope", slope);
	if(level)
		m_limits.Validate("trigger_level", *level);

	SendCommand(":TRIG:MODE EDGE");
	SendCommand(":TRIG:EDGE:SOUR " + source);
	SendCommand(":TRIG:EDGE:COUP " + coupling);
	SendCommand(":TRIG:EDGE:SLOP " + slope);
	if(level)
		SendCommand(":TRIG:EDGE:LEV " + to_string_sci(*level));
}

void KeysightDSOX3024AOscilloscope::ConfigureWaveformTransfer(
	int channel,
	WaveformPreamble::SampleFormat format,
	RawSampleBuffer::ByteOrder order,
	RawSampleBuffer::Signedness signedness)
{
	auto prefix = GetChannelPrefix(channel);

	string fmt;
	switch(format)
	{
		case WaveformPreamble::FORMAT_BYTE:
			fmt = "BYTE";
			break;

		case WaveformPreamble::FORMAT_WORD:
			fmt = "WORD";
			break;

		case WaveformPreamble::FORMAT_ASCII:
			fmt = "ASC";
			break;

		default:
			throw UnsupportedSampleFormatError(format);
	}

	LogDebug("Transferring %s as %s, %s, %s\n",
		prefix.substr(1).c_str(),
		WaveformPreamble::GetNameOfFormat(format).c_str(),
		RawSampleBuffer::GetNameOfByteOrder(order).c_str(),
		RawSampleBuffer::GetNameOfSignedness(signedness).c_str());

	SendCommand(":WAV:SOUR " + prefix.substr(1));
	SendCommand(":WAV:FORM " + fmt);
	SendCommand(string(":WAV:BYT ") + ((order == RawSampleBuffer::BYTE_ORDER_MSB_FIRST) ? "MSBF" : "LSBF"));
	SendCommand(string(":WAV:UNS ") + ((signedness == RawSampleBuffer::SAMPLES_UNSIGNED) ? "1" : "0"));
	SendCommand(":WAV:POIN:MODE RAW");

	m_transferFormat = format;
}

void KeysightDSOX3024AOscilloscope::SetAcquisitionType(WaveformPreamble::AcquisitionType type)
{
	switch(type)
	{
		case WaveformPreamble::TYPE_NORMAL:
			SendCommand(":ACQ:TYPE NORM");
			break;

		case WaveformPreamble::TYPE_PEAK:
			SendCommand(":ACQ:TYPE PEAK");
			break;

		case WaveformPreamble::TYPE_AVERAGE:
			SendCommand(":ACQ:TYPE AVER");
			break;

		case WaveformPreamble::TYPE_HIRES:
			SendCommand(":ACQ:TYPE HRES");
			break;
	}
}

void KeysightDSOX3024AOscilloscope::Autoscale()
{
	SendCommand(":AUT");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Acquisition

void KeysightDSOX3024AOscilloscope::InitiateAcquisition()
{
	SendCommand(":SING");
}

string KeysightDSOX3024AOscilloscope::QueryPreamble()
{
	return Trim(Query(":WAV:PRE?"));
}

/**
	@brief Reads the waveform in whatever encoding ConfigureWaveformTransfer() last selected
 */
RawSampleBuffer KeysightDSOX3024AOscilloscope::QueryWaveformData()
{
	if(m_transferFormat == WaveformPreamble::FORMAT_ASCII)
		return RawSampleBuffer::FromAsciiValues(m_transport->SendCommandImmediateWithAsciiValuesReply(":WAV:DATA?"));

	auto data = m_transport->SendCommandImmediateWithRawBlockReply(":WAV:DATA?");
	LogTrace("Got %zu bytes of waveform data\n", data.size());
	return RawSampleBuffer::FromBytes(std::move(data));
}
