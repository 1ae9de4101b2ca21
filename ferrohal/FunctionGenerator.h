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
	@brief Declaration of FunctionGenerator
 */

#ifndef FunctionGenerator_h
#define FunctionGenerator_h

/**
	@brief A baseband arbitrary waveform generator

	Channel numbers are one-based. Arbitrary waveforms are loaded into volatile memory first and may then be copied
	to a named slot in non-volatile memory.
 */
class FunctionGenerator : public virtual Instrument
{
public:
	FunctionGenerator();
	virtual ~FunctionGenerator();

	virtual unsigned int GetInstrumentTypes() const override;

	/**
		@brief Gets the number of output channels
	 */
	virtual size_t GetFunctionChannelCount() const =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Arbitrary waveform memory

	/**
		@brief Gets the time between two points of an arbitrary waveform at the maximum sample rate, in seconds
	 */
	virtual double GetArbResolution() const =0;

	/**
		@brief Gets the largest number of points an arbitrary waveform may have
	 */
	virtual size_t GetMaxArbPoints() const =0;

	/**
		@brief Gets the DAC code for full positive output. Uploaded codes must lie in [-code, +code].
	 */
	virtual double GetArbFullScaleCode() const =0;

	/**
		@brief Loads DAC codes into the volatile arbitrary waveform memory of a channel

		@param chan		Channel number
		@param codes	Samples, already scaled to [-GetArbFullScaleCode(), +GetArbFullScaleCode()]
	 */
	virtual void UploadArbitraryWaveform(int chan, const std::vector<double>& codes) =0;

	/**
		@brief Copies the volatile waveform of a channel into non-volatile memory under a name

		@return	True if the waveform was stored, false if non-volatile memory has no free slot
	 */
	virtual bool StoreArbitraryWaveform(int chan, const std::string& name) =0;

	/**
		@brief Name of the volatile waveform memory, for use with SelectArbitraryWaveform()
	 */
	virtual std::string GetVolatileWaveformName() const =0;

	/**
		@brief Plays back an arbitrary waveform

		The normalized waveform is mapped so that full negative code is (offset - gain/2) volts and full positive code
		is (offset + gain/2) volts, and the whole table repeats at the given frequency.

		@param chan		Channel number
		@param name		Stored waveform name, or GetVolatileWaveformName()
		@param gain		Peak-to-peak amplitude, in volts
		@param offset	DC offset, in volts
		@param freq		Repetition rate of the whole table, in Hz
	 */
	virtual void SelectArbitraryWaveform(int chan, const std::string& name, double gain, double offset, double freq) =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Output and triggering

	virtual void SetOutputEnabled(int chan, bool on) =0;

	/**
		@brief Configures the source impedance of an output and the load impedance it assumes

		@param chan		Channel number
		@param source	Source impedance, in ohms
		@param load		Load impedance, in ohms
	 */
	virtual void ConfigureImpedance(int chan, double source, double load) =0;

	/**
		@brief Chooses what starts a burst

		@param chan		Channel number
		@param source	IMMediate, EXTernal, MANual, ...
		@param mode		CONTinuous, TRIGgered or GATed
		@param slope	POSitive, NEGative or EITHer
	 */
	virtual void ConfigureTrigger(
		int chan,
		const std::string& source,
		const std::string& mode = "TRIGgered",
		const std::string& slope = "POSitive") =0;

	/**
		@brief Starts a burst on every channel armed for manual triggering
	 */
	virtual void SendSoftwareTrigger() =0;

	/**
		@brief Makes channel 2 follow the settings of channel 1
	 */
	virtual void CoupleChannels() =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Driver creation

public:
	typedef FunctionGenerator* (*CreateProcType)(SCPITransport*, const YAML::Node&);
	static void DoAddDriverClass(std::string name, CreateProcType proc);

	static void EnumDrivers(std::vector<std::string>& names);
	static FunctionGenerator* CreateFunctionGenerator(
		std::string driver,
		SCPITransport* transport,
		const YAML::Node& model);

protected:
	typedef std::map< std::string, CreateProcType > CreateMapType;
	static CreateMapType m_createprocs;
};

#define FUNCTION_GENERATOR_INITPROC(T) \
	static FunctionGenerator* CreateInstance(SCPITransport* transport, const YAML::Node& model) \
	{ \
		auto config = GetDefaultModelConfig(); \
		config.LoadConfiguration(model); \
		return new T(transport, config); \
	} \
	virtual std::string GetDriverName() const override \
	{ return GetDriverNameInternal(); }

#define AddFunctionGeneratorDriverClass(T) \
	FunctionGenerator::DoAddDriverClass(T::GetDriverNameInternal(), T::CreateInstance)

#endif
