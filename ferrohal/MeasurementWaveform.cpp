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
	@brief Implementation of MeasurementWaveform
 */

#include "ferrohal.h"

#include <cmath>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

MeasurementWaveform::MeasurementWaveform(const string& typeTag, double offset)
	: m_typeTag(typeTag)
	, m_waveformName(typeTag)
	, m_offset(offset)
{
}

MeasurementWaveform::~MeasurementWaveform()
{
}

/**
	@brief Creates a measurement from an experiment description

	The node must have a type key (hysteresis or pund). The remaining keys are specific to each type and all
	optional. An optional name key overrides the name the waveform is stored under.
 */
MeasurementWaveform* MeasurementWaveform::CreateFromConfig(const YAML::Node& node)
{
	if(!node || !node.IsMap())
		throw ConfigurationError("Experiment description must be a map");
	if(!node["type"])
		throw ConfigurationError("Experiment description has no type");

	auto type = strtolower(node["type"].as<string>());
	MeasurementWaveform* ret = nullptr;

	if(type == "hysteresis")
	{
		double frequency = 1000;
		double amplitude = 1;
		double offset = 0;
		unsigned int cycles = 2;
		LoadConfigValue(node, "frequency", frequency);
		LoadConfigValue(node, "amplitude", amplitude);
		LoadConfigValue(node, "offset", offset);
		LoadConfigValue(node, "cycles", cycles);

		ret = new HysteresisLoop(frequency, amplitude, offset, cycles);
	}
	else if(type == "pund")
	{
		PUNDPulse::Parameters p;
		LoadConfigValue(node, "reset_amplitude", p.resetAmplitude);
		LoadConfigValue(node, "reset_width", p.resetWidth);
		LoadConfigValue(node, "reset_delay", p.resetDelay);
		LoadConfigValue(node, "pu_amplitude", p.puAmplitude);
		LoadConfigValue(node, "pu_width", p.puWidth);
		LoadConfigValue(node, "pu_delay", p.puDelay);
		LoadConfigValue(node, "offset", p.offset);

		ret = new PUNDPulse(p);
	}
	else
		throw ConfigurationError("Unknown experiment type \"" + type + "\"");

	if(node["name"])
		ret->SetWaveformName(node["name"].as<string>());

	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Generator settings

/**
	@brief Gets the number of points needed to play the stimulus at the generator's finest resolution

	Clamped to what the generator memory holds (with a warning) and to at least one point per breakpoint.
 */
size_t MeasurementWaveform::GetTotalPoints(const FunctionGenerator& gen) const
{
	double ideal = round(GetDuration() / gen.GetArbResolution());
	size_t nbp = GetBreakpointCount();
	size_t maxpoints = gen.GetMaxArbPoints();

	if(ideal > maxpoints)
	{
		LogWarning("%s waveform needs %.0f points at full resolution, limiting to %zu\n",
			m_typeTag.c_str(), ideal, maxpoints);
		return maxpoints;
	}
	if(ideal < nbp)
		return nbp;
	return static_cast<size_t>(ideal);
}

void MeasurementWaveform::GetVoltageExtent(double& vmin, double& vmax) const
{
	auto points = GetBreakpoints(GetBreakpointCount());
	vmin = points[0].y;
	vmax = points[0].y;
	for(auto& p : points)
	{
		vmin = min(vmin, p.y);
		vmax = max(vmax, p.y);
	}
}

/**
	@brief Peak-to-peak amplitude of the stimulus, in volts
 */
double MeasurementWaveform::GetGain() const
{
	double vmin;
	double vmax;
	GetVoltageExtent(vmin, vmax);
	return vmax - vmin;
}

/**
	@brief Voltage halfway between the stimulus extremes, plus the user offset
 */
double MeasurementWaveform::GetOffset() const
{
	double vmin;
	double vmax;
	GetVoltageExtent(vmin, vmax);
	return (vmax + vmin)/2 + m_offset;
}
