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
	@brief Tests for WaveformPreamble
 */

#include <gtest/gtest.h>

#include "../ferrohal/ferrohal.h"

using namespace std;

TEST(WaveformPreamble, ParsesAllTenFields)
{
	auto p = WaveformPreamble::Parse("1,2,1000,8,2.0E-09,-1.0E-06,0,3.5E-04,-1.25E-01,32768");

	EXPECT_EQ(p.GetFormat(), WaveformPreamble::FORMAT_WORD);
	EXPECT_EQ(p.GetType(), WaveformPreamble::TYPE_AVERAGE);
	EXPECT_EQ(p.GetPointCount(), 1000u);
	EXPECT_EQ(p.GetCount(), 8);
	EXPECT_DOUBLE_EQ(p.GetXIncrement(), 2.0e-9);
	EXPECT_DOUBLE_EQ(p.GetXOrigin(), -1.0e-6);
	EXPECT_EQ(p.GetXReference(), 0);
	EXPECT_FLOAT_EQ(p.GetYIncrement(), 3.5e-4f);
	EXPECT_FLOAT_EQ(p.GetYOrigin(), -0.125f);
	EXPECT_EQ(p.GetYReference(), 32768);
}

TEST(WaveformPreamble, AcceptsPlusSignsAndWhitespace)
{
	auto p = WaveformPreamble::Parse(
		"+0, +0, +62500, +1, +1.60000000E-08, -5.00000000E-04, +0, +4.06504083E-04, +1.30000007E+00, +128\n");

	EXPECT_EQ(p.GetFormat(), WaveformPreamble::FORMAT_BYTE);
	EXPECT_EQ(p.GetPointCount(), 62500u);
	EXPECT_DOUBLE_EQ(p.GetXIncrement(), 1.6e-8);
	EXPECT_DOUBLE_EQ(p.GetXOrigin(), -5e-4);
	EXPECT_EQ(p.GetYReference(), 128);
}

TEST(WaveformPreamble, RejectsWrongFieldCount)
{
	EXPECT_THROW(WaveformPreamble::Parse("0,0,4,1,1e-6,0,0,1.0,0.0"), MalformedPreambleError);
	EXPECT_THROW(WaveformPreamble::Parse("0,0,4,1,1e-6,0,0,1.0,0.0,0,0"), MalformedPreambleError);
	EXPECT_THROW(WaveformPreamble::Parse(""), MalformedPreambleError);
}

TEST(WaveformPreamble, RejectsNonNumericFields)
{
	EXPECT_THROW(WaveformPreamble::Parse("0,0,four,1,1e-6,0,0,1.0,0.0,0"), MalformedPreambleError);
	EXPECT_THROW(WaveformPreamble::Parse("0,0,4,1,1e-6x,0,0,1.0,0.0,0"), MalformedPreambleError);
	EXPECT_THROW(WaveformPreamble::Parse("0,0,4.5,1,1e-6,0,0,1.0,0.0,0"), MalformedPreambleError);
	EXPECT_THROW(WaveformPreamble::Parse("0,0,4,1,,0,0,1.0,0.0,0"), MalformedPreambleError);
}

TEST(WaveformPreamble, RejectsImpossibleValues)
{
	//no points
	EXPECT_THROW(WaveformPreamble::Parse("0,0,0,1,1e-6,0,0,1.0,0.0,0"), MalformedPreambleError);

	//sample interval not positive
	EXPECT_THROW(WaveformPreamble::Parse("0,0,4,1,0,0,0,1.0,0.0,0"), MalformedPreambleError);
	EXPECT_THROW(WaveformPreamble::Parse("0,0,4,1,-1e-6,0,0,1.0,0.0,0"), MalformedPreambleError);

	//unknown acquisition type
	EXPECT_THROW(WaveformPreamble::Parse("0,7,4,1,1e-6,0,0,1.0,0.0,0"), MalformedPreambleError);
}

TEST(WaveformPreamble, LeavesFormatCheckToDecoder)
{
	auto p = WaveformPreamble::Parse("2,0,4,1,1e-6,0,0,1.0,0.0,0");
	EXPECT_EQ(p.GetFormat(), 2);
}
