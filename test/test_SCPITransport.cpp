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
	@brief Tests of the block and value list framing shared by every transport
 */

#include <gtest/gtest.h>

#include "MockTransport.h"

#include <algorithm>

using namespace std;

TEST(SCPITransport, RawBlockReply)
{
	MockTransport t;
	t.SetRawReply(":WAV:DATA?", MockTransport::MakeBlock({1, 2, 3, '\n', 0xff}));

	auto data = t.SendCommandImmediateWithRawBlockReply(":WAV:DATA?");
	vector<uint8_t> expected = {1, 2, 3, '\n', 0xff};
	EXPECT_EQ(data, expected);
}

TEST(SCPITransport, EmptyRawBlock)
{
	MockTransport t;
	t.SetRawReply(":WAV:DATA?", MockTransport::MakeBlock({}));
	EXPECT_TRUE(t.SendCommandImmediateWithRawBlockReply(":WAV:DATA?").empty());
}

TEST(SCPITransport, MalformedRawBlocks)
{
	MockTransport t;

	//no reply at all
	EXPECT_THROW(t.SendCommandImmediateWithRawBlockReply(":WAV:DATA?"), TransportFailureError);

	//not a block
	string text = "1,2,3\n";
	t.SetRawReply(":A?", vector<uint8_t>(text.begin(), text.end()));
	EXPECT_THROW(t.SendCommandImmediateWithRawBlockReply(":A?"), TransportFailureError);
	t.FlushRXBuffer();

	//indefinite length
	string indef = "#0abc\n";
	t.SetRawReply(":B?", vector<uint8_t>(indef.begin(), indef.end()));
	EXPECT_THROW(t.SendCommandImmediateWithRawBlockReply(":B?"), TransportFailureError);
	t.FlushRXBuffer();

	//shorter than announced
	string shortblock = "#210abc";
	t.SetRawReply(":C?", vector<uint8_t>(shortblock.begin(), shortblock.end()));
	EXPECT_THROW(t.SendCommandImmediateWithRawBlockReply(":C?"), TransportFailureError);
	t.FlushRXBuffer();

	//garbage in the length digits
	string garbled = "#4ab12xyz\n";
	t.SetRawReply(":D?", vector<uint8_t>(garbled.begin(), garbled.end()));
	EXPECT_THROW(t.SendCommandImmediateWithRawBlockReply(":D?"), TransportFailureError);
	t.FlushRXBuffer();

	//negative length
	string negative = "#3-12abc\n";
	t.SetRawReply(":E?", vector<uint8_t>(negative.begin(), negative.end()));
	EXPECT_THROW(t.SendCommandImmediateWithRawBlockReply(":E?"), TransportFailureError);
	t.FlushRXBuffer();

	//length far beyond any waveform memory
	string huge = "#9999999999\n";
	t.SetRawReply(":F?", vector<uint8_t>(huge.begin(), huge.end()));
	EXPECT_THROW(t.SendCommandImmediateWithRawBlockReply(":F?"), TransportFailureError);
}

TEST(SCPITransport, AsciiValuesReply)
{
	MockTransport t;
	t.SetReply(":WAV:DATA?", "1.5,-2.0E-03, +4 ,");

	auto values = t.SendCommandImmediateWithAsciiValuesReply(":WAV:DATA?");
	ASSERT_EQ(values.size(), 3u);
	EXPECT_DOUBLE_EQ(values[0], 1.5);
	EXPECT_DOUBLE_EQ(values[1], -2e-3);
	EXPECT_DOUBLE_EQ(values[2], 4);
}

TEST(SCPITransport, AsciiValuesInsideBlockHeader)
{
	MockTransport t;
	t.SetReply(":WAV:DATA?", "#800000011 1.0,2.0,3");

	auto values = t.SendCommandImmediateWithAsciiValuesReply(":WAV:DATA?");
	vector<double> expected = {1, 2, 3};
	EXPECT_EQ(values, expected);
}

TEST(SCPITransport, MalformedAsciiValues)
{
	MockTransport t;
	t.SetReply(":A?", "1.0,volts,3");
	EXPECT_THROW(t.SendCommandImmediateWithAsciiValuesReply(":A?"), TransportFailureError);

	t.SetReply(":B?", "#9");
	EXPECT_THROW(t.SendCommandImmediateWithAsciiValuesReply(":B?"), TransportFailureError);
}

TEST(SCPITransport, FailedWrite)
{
	MockTransport t;
	t.FailOn("*RST");
	EXPECT_THROW(t.SendCommandImmediate("*RST"), TransportFailureError);
	EXPECT_FALSE(t.HasCommand("*RST"));
}

TEST(SCPITransport, BinaryBlockArgument)
{
	MockTransport t;
	t.SendCommandWithBinaryBlock(":DATA1:DAC VOLATILE,", {0x12, 0x34});

	ASSERT_EQ(t.GetRawWrites().size(), 1u);
	string expectedText = ":DATA1:DAC VOLATILE, #12";
	vector<uint8_t> expected(expectedText.begin(), expectedText.end());
	expected.push_back(0x12);
	expected.push_back(0x34);
	expected.push_back('\n');
	EXPECT_EQ(t.GetRawWrites()[0], expected);
	EXPECT_EQ(t.GetCommands().back(), ":DATA1:DAC VOLATILE,");
}

TEST(SCPITransport, UnknownTransportName)
{
	EXPECT_TRUE(SCPITransport::CreateTransport("carrier_pigeon", "coop") == nullptr);

	vector<string> names;
	SCPITransport::EnumTransports(names);
	EXPECT_NE(find(names.begin(), names.end(), "lan"), names.end());
}

TEST(SCPISocketTransport, RejectsBadAddresses)
{
	EXPECT_THROW(SCPITransport::CreateTransport("lan", ":5025"), ConfigurationError);
	EXPECT_THROW(SCPITransport::CreateTransport("lan", "192.168.1.20:scpi"), ConfigurationError);
	EXPECT_THROW(SCPITransport::CreateTransport("lan", "192.168.1.20:70000"), ConfigurationError);
	EXPECT_THROW(SCPITransport::CreateTransport("lan", "192.168.1.20:"), ConfigurationError);
}
