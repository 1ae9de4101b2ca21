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
	@brief Declaration of ScopeModelConfig and GeneratorModelConfig
 */

#ifndef ModelConfig_h
#define ModelConfig_h

/**
	@brief Per-model limits and capabilities of an oscilloscope

	Built-in defaults come from the static factory for each supported model. Any of them can be overridden from YAML
	before the driver is constructed, after which the driver keeps its own copy.
 */
struct ScopeModelConfig
{
	std::string model;

	///@brief Number of analog input channels
	size_t channelCount;

	///@brief Constraints checked before every configuration command
	ParameterTable limits;

	static ScopeModelConfig DSOX3024A();

	void LoadConfiguration(const YAML::Node& node);
};

/**
	@brief Per-model limits and capabilities of an arbitrary waveform generator
 */
struct GeneratorModelConfig
{
	std::string model;

	///@brief Number of output channels
	size_t channelCount;

	///@brief Time between two points of an arbitrary waveform at the maximum sample rate, in seconds
	double arbResolution;

	///@brief Largest arbitrary waveform the volatile memory holds, in points
	size_t maxArbPoints;

	///@brief DAC code corresponding to full positive output. Full negative output is the negation.
	double arbFullScaleCode;

	///@brief Number of user waveforms that fit in non-volatile memory
	size_t nonvolatileSlots;

	ParameterTable limits;

	static GeneratorModelConfig Keysight81150A();

	void LoadConfiguration(const YAML::Node& node);
};

#endif
