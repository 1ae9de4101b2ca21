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
	@brief Implementation of RawSampleBuffer
 */

#include "ferrohal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

RawSampleBuffer::RawSampleBuffer()
	: m_ascii(false)
{
}

RawSampleBuffer RawSampleBuffer::FromBytes(vector<uint8_t> bytes)
{
	RawSampleBuffer ret;
	ret.m_bytes = std::move(bytes);
	return ret;
}

RawSampleBuffer RawSampleBuffer::FromAsciiValues(vector<double> values)
{
	RawSampleBuffer ret;
	ret.m_ascii = true;
	ret.m_values = std::move(values);
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// String helpers for enums

string RawSampleBuffer::GetNameOfByteOrder(ByteOrder order)
{
	switch(order)
	{
		case BYTE_ORDER_LSB_FIRST:
			return "lsb_first";

		case BYTE_ORDER_MSB_FIRST:
		default:
			return "msb_first";
	}
}

RawSampleBuffer::ByteOrder RawSampleBuffer::GetByteOrderOfName(const string& name)
{
	auto s = strtolower(name);
	if( (s == "msb_first") || (s == "msbf") || (s == "big") )
		return BYTE_ORDER_MSB_FIRST;
	else if( (s == "lsb_first") || (s == "lsbf") || (s == "little") )
		return BYTE_ORDER_LSB_FIRST;

	throw ConfigurationError("Unknown byte order \"" + name + "\"");
}

string RawSampleBuffer::GetNameOfSignedness(Signedness s)
{
	if(s == SAMPLES_UNSIGNED)
		return "unsigned";
	return "signed";
}

RawSampleBuffer::Signedness RawSampleBuffer::GetSignednessOfName(const string& name)
{
	auto s = strtolower(name);
	if(s == "signed")
		return SAMPLES_SIGNED;
	else if(s == "unsigned")
		return SAMPLES_UNSIGNED;

	throw ConfigurationError("Unknown sample signedness \"" + name + "\"");
}
