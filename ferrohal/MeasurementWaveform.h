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
	@brief Declaration of MeasurementWaveform
 */

#ifndef MeasurementWaveform_h
#define MeasurementWaveform_h

/**
	@brief A stimulus applied to a device under test while the response is captured

	Derived classes describe the stimulus as breakpoints in volts. The base class works out how many points the
	generator needs and the gain and offset that turn the normalized table back into those volts.
 */
class MeasurementWaveform
{
public:
	MeasurementWaveform(const std::string& typeTag, double offset);
	virtual ~MeasurementWaveform();

	///@brief Short tag describing the kind of measurement ("HYSTERESIS", "PUND")
	const std::string& GetTypeTag() const
	{ return m_typeTag; }

	///@brief Name the waveform is stored under in generator memory
	const std::string& GetWaveformName() const
	{ return m_waveformName; }

	void SetWaveformName(const std::string& name)
	{ m_waveformName = name; }

	/**
		@brief Gets the length of one playback of the whole stimulus, in seconds
	 */
	virtual double GetDuration() const =0;

	/**
		@brief Gets the number of breakpoints GetBreakpoints() returns
	 */
	virtual size_t GetBreakpointCount() const =0;

	/**
		@brief Gets the stimulus corners, in seconds and volts (before user offset)

		@param totalPoints	Number of points the table will be densified to. Instantaneous edges are given the
							duration of one such point so that time stays strictly increasing.
	 */
	virtual BreakpointList GetBreakpoints(size_t totalPoints) const =0;

	size_t GetTotalPoints(const FunctionGenerator& gen) const;

	double GetGain() const;
	double GetOffset() const;

	///@brief Playback rate of the whole table, in Hz
	double GetFrequency() const
	{ return 1.0 / GetDuration(); }

	static MeasurementWaveform* CreateFromConfig(const YAML::Node& node);

protected:
	void GetVoltageExtent(double& vmin, double& vmax) const;

	std::string m_typeTag;
	std::string m_waveformName;

	///@brief DC offset added on top of the stimulus, in volts
	double m_offset;
};

#endif
