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
	@brief Declaration of KeysightDSOX3024AOscilloscope
 */

#ifndef KeysightDSOX3024AOscilloscope_h
#define KeysightDSOX3024AOscilloscope_h

/**
	@brief Keysight InfiniiVision DSO-X 3024A
 */
class KeysightDSOX3024AOscilloscope
	: public virtual SCPIInstrument
	, public virtual Oscilloscope
{
public:
	KeysightDSOX3024AOscilloscope(SCPITransport* transport, const ScopeModelConfig& config);
	virtual ~KeysightDSOX3024AOscilloscope();

	//not copyable or assignable
	KeysightDSOX3024AOscilloscope(const KeysightDSOX3024AOscilloscope& rhs) =delete;
	KeysightDSOX3024AOscilloscope& operator=(const KeysightDSOX3024AOscilloscope& rhs) =delete;

public:
	virtual size_t GetAnalogChannelCount() const override;

	//Configuration
	virtual void ConfigureTimebase(const TimebaseSettings& settings) override;
	virtual void ConfigureChannel(const ChannelSettings& settings) override;
	virtual void ConfigureTriggerCharacteristics(
		const std::string& source,
		double low,
		double high,
		const std::string& sweep) override;
	virtual void ConfigureTriggerEdge(
		const std::string& source,
		const std::string& coupling,
		const std::string& slope,
		std::optional<double> level = std::nullopt) override;
	virtual void ConfigureWaveformTransfer(
		int channel,
		WaveformPreamble::SampleFormat format,
		RawSampleBuffer::ByteOrder order,
		RawSampleBuffer::Signedness signedness) override;
	virtual void SetAcquisitionType(WaveformPreamble::AcquisitionType type) override;
	virtual void Autoscale() override;

	//Acquisition
	virtual void InitiateAcquisition() override;
	virtual std::string QueryPreamble() override;
	virtual RawSampleBuffer QueryWaveformData() override;

protected:
	std::string GetChannelPrefix(int channel);

	ScopeModelConfig m_config;

	///@brief Encoding most recently selected with ConfigureWaveformTransfer()
	WaveformPreamble::SampleFormat m_transferFormat;

public:
	static std::string GetDriverNameInternal();
	static ScopeModelConfig GetDefaultModelConfig();
	OSCILLOSCOPE_INITPROC(KeysightDSOX3024AOscilloscope)
};

#endif
