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
	@brief Built-in model configurations and their YAML overrides
 */

#include "ferrohal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// ScopeModelConfig

/**
	@brief Keysight InfiniiVision DSO-X 3024A
 */
ScopeModelConfig ScopeModelConfig::DSOX3024A()
{
	ScopeModelConfig ret;
	ret.model = "DSO-X 3024A";
	ret.channelCount = 4;

	auto& l = ret.limits;
	l.AddChoices("channel", {"1", "2", "3", "4"});
	l.AddRange("voltage_range", 8e-3, 40);
	l.AddRange("voltage_scale", 8e-4, 4);
	l.AddRange("time_range", 2e-8, 500);
	l.AddRange("time_scale", 2e-9, 50);
	l.AddChoices("time_base_type", {"MAIN", "WINDow", "WIND", "XY", "ROLL"});
	l.AddChoices("time_reference", {"LEFT", "CENTer", "CENT", "RIGHt", "RIGH"});
	l.AddChoices("channel_coupling", {"AC", "DC"});
	l.AddChoices("channel_impedance", {"ONEMeg", "ONEM", "FIFTy", "FIFT"});
	l.AddRange("probe_attenuation", 0.001, 10000);
	l.AddChoices("trigger_source", {"CHAN1", "CHAN2", "CHAN3", "CHAN4", "EXT", "EXTernal", "LINE", "WGEN"});
	l.AddChoices("trigger_sweep", {"AUTO", "NORMal", "NORM"});
	l.AddChoices("trigger_coupling", {"AC", "DC", "LFReject", "LFR"});
	l.AddChoices("trigger_slope", {"POSitive", "POS", "NEGative", "NEG", "EITHer", "EITH", "ALTernate", "ALT"});
	l.AddRange("trigger_level", -40, 40);

	return ret;
}

/**
	@brief Applies overrides from a YAML node

	Recognized keys are channels and limits. Anything else is ignored.
 */
void ScopeModelConfig::LoadConfiguration(const YAML::Node& node)
{
	if(!node)
		return;
	if(!node.IsMap())
		throw ConfigurationError("Oscilloscope model settings must be a map");

	LoadConfigValue(node, "channels", channelCount);
	limits.LoadConfiguration(node["limits"]);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// GeneratorModelConfig

/**
	@brief Keysight 81150A pulse function arbitrary noise generator
 */
GeneratorModelConfig GeneratorModelConfig::Keysight81150A()
{
	GeneratorModelConfig ret;
	ret.model = "81150A";
	ret.channelCount = 2;
	ret.arbResolution = 5e-10;			//2 GSa/s
	ret.maxArbPoints = 524288;
	ret.arbFullScaleCode = 8191;		//14 bit DAC
	ret.nonvolatileSlots = 4;

	auto& l = ret.limits;
	l.AddChoices("channel", {"1", "2"});
	l.AddRange("voltage", 8e-3, 40);
	l.AddRange("offset", -20, 20);
	l.AddRange("frequency_sine", 1e-6, 240e6);
	l.AddRange("frequency_square", 1e-6, 120e6);
	l.AddRange("frequency_ramp", 1e-6, 5e6);
	l.AddRange("frequency_pulse", 1e-6, 120e6);
	l.AddRange("frequency_pattern", 1e-6, 120e6);
	l.AddRange("frequency_arb", 1e-6, 120e6);
	l.AddChoices("func", {"sine", "square", "ramp", "pulse", "pattern", "arb"});
	l.AddChoices("source_impedance", {"5", "50"});
	l.AddRange("load_impedance", 0.3, 1e6);
	l.AddChoices("trigger_source", {"IMMediate", "IMM", "EXTernal", "EXT", "MANual", "MAN", "INTernal2", "INT2"});
	l.AddChoices("trigger_mode", {"CONTinuous", "CONT", "TRIGgered", "TRIG", "GATed", "GAT"});
	l.AddChoices("trigger_slope", {"POSitive", "POS", "NEGative", "NEG", "EITHer", "EITH"});

	return ret;
}

/**
	@brief Applies overrides from a YAML node

	Recognized keys are channels, arb_resolution, max_arb_points, arb_full_scale, nonvolatile_slots and limits.
 */
void GeneratorModelConfig::LoadConfiguration(const YAML::Node& node)
{
	if(!node)
		return;
	if(!node.IsMap())
		throw ConfigurationError("Generator model settings must be a map");

	LoadConfigValue(node, "channels", channelCount);
	LoadConfigValue(node, "arb_resolution", arbResolution);
	LoadConfigValue(node, "max_arb_points", maxArbPoints);
	LoadConfigValue(node, "arb_full_scale", arbFullScaleCode);
	LoadConfigValue(node, "nonvolatile_slots", nonvolatileSlots);

	if(arbResolution <= 0)
		throw ConfigurationError("arb_resolution must be positive");
	if(maxArbPoints < 2)
		throw ConfigurationError("max_arb_points must be at least 2");

	limits.LoadConfiguration(node["limits"]);
}
