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
	@brief Declaration of RawSampleBuffer
 */

#ifndef RawSampleBuffer_h
#define RawSampleBuffer_h

/**
	@brief Undecoded waveform samples exactly as they came off the wire

	Holds either the bytes of a binary block (8 or 16 bit integers, to be interpreted according to the preamble
	format and the byte order and signedness the scope was configured for) or floating point values already parsed
	from an ASCII reply.

	Move-only: a buffer belongs to the acquisition that fetched it.
 */
class RawSampleBuffer
{
public:

	///@brief Order of the two bytes making up a 16-bit sample
	enum ByteOrder
	{
		///@brief Most significant byte first ("big endian", the SCPI default)
		BYTE_ORDER_MSB_FIRST,

		///@brief Least significant byte first
		BYTE_ORDER_LSB_FIRST
	};

	///@brief Interpretation of integer samples
	enum Signedness
	{
		SAMPLES_SIGNED,
		SAMPLES_UNSIGNED
	};

	RawSampleBuffer();

	static RawSampleBuffer FromBytes(std::vector<uint8_t> bytes);
	static RawSampleBuffer FromAsciiValues(std::vector<double> values);

	RawSampleBuffer(RawSampleBuffer&& rhs) =default;
	RawSampleBuffer& operator=(RawSampleBuffer&& rhs) =default;

	//not copyable
	RawSampleBuffer(const RawSampleBuffer& rhs) =delete;
	RawSampleBuffer& operator=(const RawSampleBuffer& rhs) =delete;

	///@brief True if the buffer holds pre-parsed ASCII values rather than bytes
	bool IsAscii() const
	{ return m_ascii; }

	const std::vector<uint8_t>& GetBytes() const
	{ return m_bytes; }

	const std::vector<double>& GetAsciiValues() const
	{ return m_values; }

	static std::string GetNameOfByteOrder(ByteOrder order);
	static ByteOrder GetByteOrderOfName(const std::string& name);
	static std::string GetNameOfSignedness(Signedness s);
	static Signedness GetSignednessOfName(const std::string& name);

protected:
	bool m_ascii;
	std::vector<uint8_t> m_bytes;
	std::vector<double> m_values;
};

#endif
