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
	@brief Implementation of Keysight81150AFunctionGenerator
 */

#include "ferrohal.h"

#include <cmath>
#include <ctype.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

Keysight81150AFunctionGenerator::Keysight81150AFunctionGenerator(
	SCPITransport* transport,
	const GeneratorModelConfig& config)
	: SCPIInstrument(transport, config.limits)
	, m_config(config)
{
	if(m_model != m_config.model)
	{
		LogWarning("Driver %s is for the %s but the instrument identifies as \"%s\"\n",
			GetDriverNameInternal().c_str(), m_config.model.c_str(), m_model.c_str());
	}
}

Keysight81150AFunctionGenerator::~Keysight81150AFunctionGenerator()
{
}

string Keysight81150AFunctionGenerator::GetDriverNameInternal()
{
	return "keysight_81150a";
}

GeneratorModelConfig Keysight81150AFunctionGenerator::GetDefaultModelConfig()
{
	return GeneratorModelConfig::Keysight81150A();
}

size_t Keysight81150AFunctionGenerator::GetFunctionChannelCount() const
{
	return m_config.channelCount;
}

/**
	@brief Validates a one-based channel number and returns the suffix appended to channel specific commands
 */
string Keysight81150AFunctionGenerator::GetChannelSuffix(int chan)
{
	m_limits.Validate("channel", chan);
	if( (chan < 1) || (static_cast<size_t>(chan) > m_config.channelCount) )
	{
		throw ParameterOutOfRangeError(
			"channel", "Channel " + to_string(chan) + " does not exist on the " + m_config.model);
	}
	return to_string(chan);
}

/**
	@brief Checks a name is usable for a user waveform: a letter followed by up to 11 letters, digits or underscores
 */
void Keysight81150AFunctionGenerator::ValidateWaveformName(const string& name)
{
	bool ok = !name.empty() && (name.length() <= 12) && isalpha(static_cast<unsigned char>(name[0]));
	for(auto c : name)
	{
		if(!isalnum(static_cast<unsigned char>(c)) && (c != '_'))
			ok = false;
	}

	if(!ok)
		throw ParameterNotInSetError("waveform_name", "\"" + name + "\" is not a valid arbitrary waveform name");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Arbitrary waveform memory

double Keysight81150AFunctionGenerator::GetArbResolution() const
{
	return m_config.arbResolution;
}

size_t Keysight81150AFunctionGenerator::GetMaxArbPoints() const
{
	return m_config.maxArbPoints;
}

double Keysight81150AFunctionGenerator::GetArbFullScaleCode() const
{
	return m_config.arbFullScaleCode;
}

/**
	@brief Sends DAC codes as big endian 16-bit integers in a definite length block
 */
void Keysight81150AFunctionGenerator::UploadArbitraryWaveform(int chan, const vector<double>& codes)
{
	auto n = GetChannelSuffix(chan);

	if( (codes.size() < 2) || (codes.size() > m_config.maxArbPoints) )
	{
		throw ParameterOutOfRangeError("points",
			"Arbitrary waveform has " + to_string(codes.size()) + " points, must be between 2 and " +
			to_string(m_config.maxArbPoints));
	}

	vector<uint8_t> block;
	block.reserve(codes.size() * 2);
	for(auto c : codes)
	{
		if( !std::isfinite(c) || (fabs(round(c)) > m_config.arbFullScaleCode) )
		{
			char tmp[128];
			snprintf(tmp, sizeof(tmp), "DAC code %g is outside [-%g, %g]",
				c, m_config.arbFullScaleCode, m_config.arbFullScaleCode);
			throw ParameterOutOfRangeError("dac_code", tmp);
		}

		uint16_t word = static_cast<uint16_t>(static_cast<int16_t>(lround(c)));
		block.push_back(word >> 8);
		block.push_back(word & 0xff);
	}

	LogDebug("Uploading %zu point arbitrary waveform to channel %s\n", codes.size(), n.c_str());
	SendCommand(":FORM:BORD NORM");
	m_transport->SendCommandWithBinaryBlock(":DATA" + n + ":DAC VOLATILE,", block);
}

/**
	@brief Copies the volatile waveform to non-volatile memory if there is room for it
 */
bool Keysight81150AFunctionGenerator::StoreArbitraryWaveform(int chan, const string& name)
{
	auto n = GetChannelSuffix(chan);
	ValidateWaveformName(name);

	auto reply = Trim(Query(":DATA" + n + ":NVOL:FREE?"));
	char* end = nullptr;
	long nfree = strtol(reply.c_str(), &end, 10);
	if(reply.empty() || (*end != '\0'))
		throw TransportFailureError("Bad reply \"" + reply + "\" to non-volatile memory query");

	if(nfree <= 0)
	{
		LogDebug("No free non-volatile waveform slot on channel %s\n", n.c_str());
		return false;
	}

	SendCommand(":DATA" + n + ":COPY " + name + ", VOLATILE");
	return true;
}

string Keysight81150AFunctionGenerator::GetVolatileWaveformName() const
{
	return "VOLATILE";
}

void Keysight81150AFunctionGenerator::SelectArbitraryWaveform(
	int chan,
	const string& name,
	double gain,
	double offset,
	double freq)
{
	auto n = GetChannelSuffix(chan);
	if(name != GetVolatileWaveformName())
		ValidateWaveformName(name);
	m_limits.Validate("voltage", gain);
	m_limits.Validate("offset", offset);
	m_limits.Validate("frequency_arb", freq);

	SendCommand(":FUNC" + n + ":USER " + name);
	SendCommand(":FUNC" + n + " USER");
	SendCommand(":VOLT" + n + " " + to_string_sci(gain));
	SendCommand(":VOLT" + n + ":OFFS " + to_string_sci(offset));
	SendCommand(":FREQ" + n + " " + to_string_sci(freq));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Output and triggering

void Keysight81150AFunctionGenerator::SetOutputEnabled(int chan, bool on)
{
	auto n = GetChannelSuffix(chan);
	SendCommand(":OUTP" + n + (on ? " ON" : " OFF"));
}

void Keysight81150AFunctionGenerator::ConfigureImpedance(int chan, double source, double load)
{
	auto n = GetChannelSuffix(chan);
	m_limits.Validate("source_impedance", source);
	m_limits.Validate("load_impedance", load);

	SendCommand(":OUTP" + n + ":IMP " + to_string_sci(source));
	SendCommand(":OUTP" + n + ":LOAD " + to_string_sci(load));
}

/**
	@brief Selects the arming source and how the channel responds to it

	Continuous mode free-runs once armed. Triggered mode plays one burst per arming event. Gated mode plays while
	the arming input is active.
 */
void Keysight81150AFunctionGenerator::ConfigureTrigger(
	int chan,
	const string& source,
	const string& mode,
	const string& slope)
{
	auto n = GetChannelSuffix(chan);
	m_limits.Validate("trigger_source", source);
	m_limits.Validate("trigger_mode", mode);
	m_limits.Validate("trigger_slope", slope);

	auto m = strtolower(Trim(mode));
	SendCommand(":ARM:SOUR" + n + " " + source);
	SendCommand(":ARM:SLOP" + n + " " + slope);
	if(m.find("cont") == 0)
		SendCommand(":INIT" + n + ":CONT ON");
	else if(m.find("gat") == 0)
	{
		SendCommand(":INIT" + n + ":CONT OFF");
		SendCommand(":ARM:SENS" + n + " LEV");
	}
	else
	{
		SendCommand(":INIT" + n + ":CONT OFF");
		SendCommand(":ARM:SENS" + n + " EDGE");
		SendCommand(":TRIG" + n + ":COUN 1");
	}
}

void Keysight81150AFunctionGenerator::SendSoftwareTrigger()
{
	SendCommand("*TRG");
}

void Keysight81150AFunctionGenerator::CoupleChannels()
{
	SendCommand(":TRAC:CHAN1 ON");
}
