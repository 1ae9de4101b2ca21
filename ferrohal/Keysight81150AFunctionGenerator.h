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
	@brief Declaration of Keysight81150AFunctionGenerator
 */

#ifndef Keysight81150AFunctionGenerator_h
#define Keysight81150AFunctionGenerator_h

/**
	@brief Keysight 81150A pulse function arbitrary noise generator
 */
class Keysight81150AFunctionGenerator
	: public virtual SCPIInstrument
	, public virtual FunctionGenerator
{
public:
	Keysight81150AFunctionGenerator(SCPITransport* transport, const GeneratorModelConfig& config);
	virtual ~Keysight81150AFunctionGenerator();

	//not copyable or assignable
	Keysight81150AFunctionGenerator(const Keysight81150AFunctionGenerator& rhs) =delete;
	Keysight81150AFunctionGenerator& operator=(const Keysight81150AFunctionGenerator& rhs) =delete;

public:
	virtual size_t GetFunctionChannelCount() const override;

	//Arbitrary waveform memory
	virtual double GetArbResolution() const override;
	virtual size_t GetMaxArbPoints() const override;
	virtual double GetArbFullScaleCode() const override;
	virtual void UploadArbitraryWaveform(int chan, const std::vector<double>& codes) override;
	virtual bool StoreArbitraryWaveform(int chan, const std::string& name) override;
	virtual std::string GetVolatileWaveformName() const override;
	virtual void SelectArbitraryWaveform(
		int chan,
		const std::string& name,
		double gain,
		double offset,
		double freq) override;

	//Output and triggering
	virtual void SetOutputEnabled(int chan, bool on) override;
	virtual void ConfigureImpedance(int chan, double source, double load) override;
	virtual void ConfigureTrigger(
		int chan,
		const std::string& source,
		const std::string& mode = "TRIGgered",
		const std::string& slope = "POSitive") override;
	virtual void SendSoftwareTrigger() override;
	virtual void CoupleChannels() override;

protected:
	std::string GetChannelSuffix(int chan);
	void ValidateWaveformName(const std::string& name);

	GeneratorModelConfig m_config;

public:
	static std::string GetDriverNameInternal();
	static GeneratorModelConfig GetDefaultModelConfig();
	FUNCTION_GENERATOR_INITPROC(Keysight81150AFunctionGenerator)
};

#endif
