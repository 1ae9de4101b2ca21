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
	@author Andrew D. Zonenberg
	@brief Main library include file
 */

#ifndef ferrohal_h
#define ferrohal_h

#include <deque>
#include <vector>
#include <string>
#include <map>
#include <set>
#include <list>
#include <mutex>
#include <stdint.h>
#include <chrono>
#include <thread>
#include <memory>
#include <climits>
#include <optional>
#include <variant>
#include <stdexcept>
#include <float.h>
#include <stdio.h>
#include <stdlib.h>

#include <sigc++/sigc++.h>

#include <yaml-cpp/yaml.h>

#include <log/log.h>

#include "config.h"

#include "FerrohalExceptions.h"
#include "ParameterTable.h"

#include "SCPITransport.h"
#include "SCPISocketTransport.h"
#include "SCPILinuxGPIBTransport.h"

#include "RawSampleBuffer.h"
#include "WaveformPreamble.h"
#include "Trace.h"
#include "WaveformDecoder.h"
#include "ArbWaveformSynthesizer.h"

#include "ModelConfig.h"
#include "Instrument.h"
#include "SCPIInstrument.h"
#include "Oscilloscope.h"
#include "FunctionGenerator.h"
#include "KeysightDSOX3024AOscilloscope.h"
#include "Keysight81150AFunctionGenerator.h"

#include "ArbWaveformSequence.h"
#include "MeasurementWaveform.h"
#include "HysteresisLoop.h"
#include "PUNDPulse.h"
#include "SessionConfig.h"
#include "AcquisitionSession.h"
#include "CSVTraceWriter.h"

std::string Trim(const std::string& str);

std::string to_string_sci(double d);

void TransportStaticInit();
void DriverStaticInit();

std::vector<std::string> explode(const std::string& str, char separator);
std::vector<std::string> split_fields(const std::string& str, char separator);
std::string strtolower(const std::string& s);

/**
	@brief Reads an optional value from a YAML map, leaving the default in place if the key is absent

	@throws ConfigurationError if the key is present but cannot be converted
 */
template<class T>
void LoadConfigValue(const YAML::Node& node, const char* key, T& value)
{
	auto n = node[key];
	if(!n)
		return;

	if(!YAML::convert<T>::decode(n, value))
		throw ConfigurationError(std::string("Setting \"") + key + "\" has the wrong type");
}

#endif
