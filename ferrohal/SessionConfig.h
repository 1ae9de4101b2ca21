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
	@brief Declaration of SessionConfig
 */

#ifndef SessionConfig_h
#define SessionConfig_h

/**
	@brief Everything about an acquisition session other than the stimulus itself
 */
class SessionConfig
{
public:
	SessionConfig();

	void LoadConfiguration(const YAML::Node& node);

	///@brief Time to wait after the software trigger before reading the capture
	std::chrono::milliseconds m_settleTime;

	///@brief Generator channel the stimulus is played on
	int m_generatorChannel;

	double m_sourceImpedance;
	double m_loadImpedance;

	///@brief Generator arming source (MANual so that SendSoftwareTrigger() starts the burst)
	std::string m_generatorTriggerSource;

	///@brief Scope channel the response is captured on
	int m_scopeChannel;

	///@brief Vertical scale of the scope channel, in volts per division
	double m_voltageScale;

	std::string m_channelImpedance;

	///@brief Capture window as a multiple of the stimulus duration
	double m_timebaseMargin;

	std::string m_triggerSource;
	double m_triggerLow;
	double m_triggerHigh;
	std::string m_triggerSweep;
	std::string m_triggerCoupling;
	std::string m_triggerSlope;

	WaveformPreamble::SampleFormat m_transferFormat;
	RawSampleBuffer::ByteOrder m_byteOrder;
	RawSampleBuffer::Signedness m_signedness;

	///@brief Where the CLI writes the trace
	std::string m_outputPath;
};

#endif
