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
	@brief Declaration of WaveformPreamble
 */

#ifndef WaveformPreamble_h
#define WaveformPreamble_h

/**
	@brief Metadata describing one captured trace, as reported by :WAVeform:PREamble?

	The reply is a ten field comma separated record:

	format, type, points, count, xincrement, xorigin, xreference, yincrement, yorigin, yreference

	A preamble is parsed fresh for every acquisition and never modified afterwards.
 */
class WaveformPreamble
{
public:

	enum SampleFormat
	{
		FORMAT_BYTE		= 0,
		FORMAT_WORD		= 1,
		FORMAT_ASCII	= 4
	};

	enum AcquisitionType
	{
		TYPE_NORMAL		= 0,
		TYPE_PEAK		= 1,
		TYPE_AVERAGE	= 2,
		TYPE_HIRES		= 3
	};

	static WaveformPreamble Parse(const std::string& text);

	///@brief Raw format code. Not range checked here so the decoder can report unsupported formats separately.
	int GetFormat() const
	{ return m_format; }

	AcquisitionType GetType() const
	{ return m_type; }

	size_t GetPointCount() const
	{ return m_points; }

	///@brief Number of averages (1 outside average mode)
	int64_t GetCount() const
	{ return m_count; }

	double GetXIncrement() const
	{ return m_xincrement; }

	double GetXOrigin() const
	{ return m_xorigin; }

	int64_t GetXReference() const
	{ return m_xreference; }

	float GetYIncrement() const
	{ return m_yincrement; }

	float GetYOrigin() const
	{ return m_yorigin; }

	int64_t GetYReference() const
	{ return m_yreference; }

	static std::string GetNameOfFormat(int format);

protected:
	WaveformPreamble();

	int m_format;
	AcquisitionType m_type;
	size_t m_points;
	int64_t m_count;
	double m_xincrement;
	double m_xorigin;
	int64_t m_xreference;
	float m_yincrement;
	float m_yorigin;
	int64_t m_yreference;
};

#endif
