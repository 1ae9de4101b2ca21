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
	@brief Implementation of WaveformDecoder
 */

#include "ferrohal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Decoding

/**
	@brief Parses a preamble reply and decodes the samples that go with it

	@param preambleText	Reply to :WAVeform:PREamble?
	@param samples		Reply to :WAVeform:DATA?
	@param order		Byte order the scope was told to send 16-bit samples in
	@param signedness	Whether integer samples are signed
 */
Trace WaveformDecoder::Decode(
	const string& preambleText,
	const RawSampleBuffer& samples,
	RawSampleBuffer::ByteOrder order,
	RawSampleBuffer::Signedness signedness)
{
	return Decode(WaveformPreamble::Parse(preambleText), samples, order, signedness);
}

/**
	@brief Applies the preamble scaling to every sample

	time[i] = i * xincrement + xorigin, voltage[i] = sample[i] * yincrement + yorigin.

	ASCII samples are sent in volts and are used unmodified.
 */
Trace WaveformDecoder::Decode(
	const WaveformPreamble& preamble,
	const RawSampleBuffer& samples,
	RawSampleBuffer::ByteOrder order,
	RawSampleBuffer::Signedness signedness)
{
	auto raw = ExtractSamples(preamble, samples, order, signedness);

	size_t len = raw.size();
	vector<double> time(len);
	vector<double> voltage(len);

	double xinc = preamble.GetXIncrement();
	double xorg = preamble.GetXOrigin();
	for(size_t i=0; i<len; i++)
		time[i] = i*xinc + xorg;

	if(preamble.GetFormat() == WaveformPreamble::FORMAT_ASCII)
		voltage = std::move(raw);
	else
	{
		double yinc = preamble.GetYIncrement();
		double yorg = preamble.GetYOrigin();
		for(size_t i=0; i<len; i++)
			voltage[i] = raw[i]*yinc + yorg;
	}

	LogTrace("Decoded %zu samples\n", len);
	return Trace(std::move(time), std::move(voltage));
}

/**
	@brief Converts the raw buffer to one double per sample, without scaling
 */
vector<double> WaveformDecoder::ExtractSamples(
	const WaveformPreamble& preamble,
	const RawSampleBuffer& samples,
	RawSampleBuffer::ByteOrder order,
	RawSampleBuffer::Signedness signedness)
{
	size_t npoints = preamble.GetPointCount();
	bool issigned = (signedness == RawSampleBuffer::SAMPLES_SIGNED);
	vector<double> ret;

	switch(preamble.GetFormat())
	{
		case WaveformPreamble::FORMAT_BYTE:
			{
				if(samples.IsAscii())
					throw SampleCountMismatchError("BYTE format preamble but ASCII sample buffer");

				auto& bytes = samples.GetBytes();
				if(bytes.size() != npoints)
				{
					throw SampleCountMismatchError(
						"Preamble announces " + to_string(npoints) + " points but got " +
						to_string(bytes.size()) + " bytes");
				}

				ret.resize(npoints);
				for(size_t i=0; i<npoints; i++)
				{
					if(issigned)
						ret[i] = static_cast<int8_t>(bytes[i]);
					else
						ret[i] = bytes[i];
				}
			}
			break;

		case WaveformPreamble::FORMAT_WORD:
			{
				if(samples.IsAscii())
					throw SampleCountMismatchError("WORD format preamble but ASCII sample buffer");

				auto& bytes = samples.GetBytes();
				if(bytes.size() & 1)
				{
					throw SampleCountMismatchError(
						"WORD format data has an odd byte count (" + to_string(bytes.size()) + ")");
				}
				if(bytes.size() / 2 != npoints)
				{
					throw SampleCountMismatchError(
						"Preamble announces " + to_string(npoints) + " points but got " +
						to_string(bytes.size() / 2) + " words");
				}

				bool msbfirst = (order == RawSampleBuffer::BYTE_ORDER_MSB_FIRST);
				ret.resize(npoints);
				for(size_t i=0; i<npoints; i++)
				{
					uint8_t a = bytes[i*2];
					uint8_t b = bytes[i*2 + 1];
					uint16_t word;
					if(msbfirst)
						word = (a << 8) | b;
					else
						word = (b << 8) | a;

					if(issigned)
						ret[i] = static_cast<int16_t>(word);
					else
						ret[i] = word;
				}
			}
			break;

		case WaveformPreamble::FORMAT_ASCII:
			{
				if(!samples.IsAscii())
					throw SampleCountMismatchError("ASCii format preamble but binary sample buffer");

				ret = samples.GetAsciiValues();
				if(ret.size() != npoints)
				{
					throw SampleCountMismatchError(
						"Preamble announces " + to_string(npoints) + " points but got " +
						to_string(ret.size()) + " values");
				}
			}
			break;

		default:
			throw UnsupportedSampleFormatError(preamble.GetFormat());
	}

	return ret;
}
