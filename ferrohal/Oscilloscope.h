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
	@brief Declaration of Oscilloscope
 */

#ifndef Oscilloscope_h
#define Oscilloscope_h

/**
	@brief Horizontal settings for a capture

	Unset optional values are left at whatever the instrument currently has.
 */
struct TimebaseSettings
{
	///@brief MAIN, WINDow, XY or ROLL
	std::string mode = "MAIN";

	///@brief Time from the trigger to the reference point, in seconds
	std::optional<double> position;

	///@brief Full screen width, in seconds
	std::optional<double> range;

	///@brief Horizontal scale, in seconds per division
	std::optional<double> scale;

	///@brief Where on screen the trigger point sits (LEFT, CENTer or RIGHt)
	std::string reference = "CENTer";

	bool vernier = false;
};

///@brief Vertical settings for one analog channel
struct ChannelSettings
{
	int channel = 1;

	///@brief Volts per division
	std::optional<double> scale;

	///@brief Full screen height, in volts
	std::optional<double> range;

	std::optional<double> offset;
	std::string coupling = "DC";
	double probeAttenuation = 1;

	///@brief ONEMeg or FIFTy
	std::string impedance = "ONEMeg";

	bool enabled = true;
};

/**
	@brief Generic representation of an oscilloscope

	All channel numbers are one-based, as in the instrument's own command set.
 */
class Oscilloscope : public virtual Instrument
{
public:
	Oscilloscope();
	virtual ~Oscilloscope();

	virtual unsigned int GetInstrumentTypes() const override;

	/**
		@brief Gets the number of analog input channels
	 */
	virtual size_t GetAnalogChannelCount() const =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Configuration

	virtual void ConfigureTimebase(const TimebaseSettings& settings) =0;
	virtual void ConfigureChannel(const ChannelSettings& settings) =0;

	/**
		@brief Sets up trigger source, hysteresis thresholds and sweep mode

		@param source	Trigger source (CHAN<n>, EXTernal, LINE, ...)
		@param low		Lower threshold, in volts
		@param high		Upper threshold, in volts
		@param sweep	AUTO or NORMal
	 */
	virtual void ConfigureTriggerCharacteristics(
		const std::string& source,
		double low,
		double high,
		const std::string& sweep) =0;

	/**
		@brief Selects an edge trigger

		@param source	Trigger source
		@param coupling	Input coupling (AC, DC, LFReject)
		@param slope	POSitive, NEGative, EITHer or ALTernate
		@param level	Trigger level in volts, if it should be changed
	 */
	virtual void ConfigureTriggerEdge(
		const std::string& source,
		const std::string& coupling,
		const std::string& slope,
		std::optional<double> level = std::nullopt) =0;

	/**
		@brief Selects which channel :WAVeform:DATA? returns, and how the samples are encoded
	 */
	virtual void ConfigureWaveformTransfer(
		int channel,
		WaveformPreamble::SampleFormat format,
		RawSampleBuffer::ByteOrder order,
		RawSampleBuffer::Signedness signedness) =0;

	virtual void SetAcquisitionType(WaveformPreamble::AcquisitionType type) =0;

	///@brief Lets the instrument pick its own settings for the current signal
	virtual void Autoscale() =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Acquisition

	/**
		@brief Arms the trigger for exactly one acquisition
	 */
	virtual void InitiateAcquisition() =0;

	/**
		@brief Reads the preamble for the channel selected by ConfigureWaveformTransfer()
	 */
	virtual std::string QueryPreamble() =0;

	/**
		@brief Reads the samples for the channel selected by ConfigureWaveformTransfer()
	 */
	virtual RawSampleBuffer QueryWaveformData() =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Driver creation

public:
	typedef Oscilloscope* (*CreateProcType)(SCPITransport*, const YAML::Node&);
	static void DoAddDriverClass(std::string name, CreateProcType proc);

	static void EnumDrivers(std::vector<std::string>& names);
	static Oscilloscope* CreateOscilloscope(std::string driver, SCPITransport* transport, const YAML::Node& model);

protected:
	//Class enumeration
	typedef std::map< std::string, CreateProcType > CreateMapType;
	static CreateMapType m_createprocs;
};

#define OSCILLOSCOPE_INITPROC(T) \
	static Oscilloscope* CreateInstance(SCPITransport* transport, const YAML::Node& model) \
	{ \
		auto config = GetDefaultModelConfig(); \
		config.LoadConfiguration(model); \
		return new T(transport, config); \
	} \
	virtual std::string GetDriverName() const override \
	{ return GetDriverNameInternal(); }

#define AddDriverClass(T) Oscilloscope::DoAddDriverClass(T::GetDriverNameInternal(), T::CreateInstance)

#endif
