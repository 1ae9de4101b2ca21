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
	@brief Command text produced by the Keysight DSO-X 3024A driver
 */

#include <gtest/gtest.h>

#include "MockTransport.h"

using namespace std;

class KeysightDSOX3024ATest : public testing::Test
{
protected:
	void SetUp() override
	{
		m_transport = new MockTransport("KEYSIGHT TECHNOLOGIES,DSO-X 3024A,MY58493127,07.50.2021102830");
		m_scope.reset(new KeysightDSOX3024AOscilloscope(m_transport, ScopeModelConfig::DSOX3024A()));
		m_transport->ClearCommands();
	}

	MockTransport* m_transport;
	unique_ptr<KeysightDSOX3024AOscilloscope> m_scope;
};

TEST_F(KeysightDSOX3024ATest, Identification)
{
	EXPECT_EQ(m_scope->GetVendor(), "KEYSIGHT TECHNOLOGIES");
	EXPECT_EQ(m_scope->GetName(), "DSO-X 3024A");
	EXPECT_EQ(m_scope->GetDriverName(), "keysight_dsox3024a");
	EXPECT_EQ(m_scope->GetAnalogChannelCount(), 4u);
	EXPECT_EQ(m_scope->GetTransportConnectionString(), "mock");
	EXPECT_EQ(m_scope->GetInstrumentTypes(), (unsigned int)Instrument::INST_OSCILLOSCOPE);
}

TEST_F(KeysightDSOX3024ATest, ConfigureTimebase)
{
	TimebaseSettings tb;
	tb.mode = "MAIN";
	tb.reference = "CENTer";
	tb.scale = 2e-4;
	tb.position = 1e-3;
	m_scope->ConfigureTimebase(tb);

	vector<string> expected =
	{
		":TIM:MODE MAIN",
		":TIM:POS 1.000000e-03",
		":TIM:REF CENTer",
		":TIM:SCAL 2.000000e-04",
		":TIM:VERN 0"
	};
	EXPECT_EQ(m_transport->GetCommands(), expected);
}

TEST_F(KeysightDSOX3024ATest, TimebaseLimits)
{
	TimebaseSettings tb;
	tb.scale = 1e-10;
	EXPECT_THROW(m_scope->ConfigureTimebase(tb), ParameterOutOfRangeError);

	tb.scale = 1e-3;
	tb.range = 1000;
	EXPECT_THROW(m_scope->ConfigureTimebase(tb), ParameterOutOfRangeError);

	tb.range.reset();
	tb.mode = "SIDEWAYS";
	EXPECT_THROW(m_scope->ConfigureTimebase(tb), ParameterNotInSetError);

	//long and short forms are both fine, in any case
	tb.mode = "window";
	EXPECT_NO_THROW(m_scope->ConfigureTimebase(tb));
	tb.mode = "WIND";
	EXPECT_NO_THROW(m_scope->ConfigureTimebase(tb));
}

TEST_F(KeysightDSOX3024ATest, ConfigureChannel)
{
	ChannelSettings chan;
	chan.channel = 2;
	chan.scale = 0.01;
	chan.impedance = "FIFT";
	m_scope->ConfigureChannel(chan);

	vector<string> expected =
	{
		":CHAN2:DISP ON",
		":CHAN2:PROB 1.000000e+00",
		":CHAN2:COUP DC",
		":CHAN2:IMP FIFT",
		":CHAN2:SCAL 1.000000e-02"
	};
	EXPECT_EQ(m_transport->GetCommands(), expected);
}

TEST_F(KeysightDSOX3024ATest, ChannelLimits)
{
	ChannelSettings chan;
	chan.channel = 5;
	EXPECT_THROW(m_scope->ConfigureChannel(chan), ParameterNotInSetError);

	chan.channel = 1;
	chan.scale = 5;
	EXPECT_THROW(m_scope->ConfigureChannel(chan), ParameterOutOfRangeError);

	chan.scale = 0.1;
	chan.range = 1e-3;
	EXPECT_THROW(m_scope->ConfigureChannel(chan), ParameterOutOfRangeError);

	chan.range.reset();
	chan.coupling = "GND";
	EXPECT_THROW(m_scope->ConfigureChannel(chan), ParameterNotInSetError);

	EXPECT_TRUE(m_transport->GetCommands().empty());
}

TEST_F(KeysightDSOX3024ATest, ConfigureTrigger)
{
	m_scope->ConfigureTriggerCharacteristics("EXT", 0.75, 0.95, "NORM");
	m_scope->ConfigureTriggerEdge("EXT", "DC", "POS", 0.5);

	vector<string> expected =
	{
		":TRIG:LEV:HIGH 9.500000e-01,EXT",
		":TRIG:LEV:LOW 7.500000e-01,EXT",
		":TRIG:SWE NORM",
		":TRIG:MODE EDGE",
		":TRIG:EDGE:SOUR EXT",
		":TRIG:EDGE:COUP DC",
		":TRIG:EDGE:SLOP POS",
		":TRIG:EDGE:LEV 5.000000e-01"
	};
	EXPECT_EQ(m_transport->GetCommands(), expected);
}

TEST_F(KeysightDSOX3024ATest, TriggerLimits)
{
	EXPECT_THROW(m_scope->ConfigureTriggerCharacteristics("EXT", 0.95, 0.75, "NORM"), ParameterOutOfRangeError);
	EXPECT_THROW(m_scope->ConfigureTriggerCharacteristics("CHAN9", 0.75, 0.95, "NORM"), ParameterNotInSetError);
	EXPECT_THROW(m_scope->ConfigureTriggerCharacteristics("EXT", 0.75, 0.95, "SINGLE"), ParameterNotInSetError);
	EXPECT_THROW(m_scope->ConfigureTriggerEdge("EXT", "DC", "UP"), ParameterNotInSetError);

	EXPECT_TRUE(m_transport->GetCommands().empty());
}

TEST_F(KeysightDSOX3024ATest, WaveformTransferAndBlockRead)
{
	m_scope->ConfigureWaveformTransfer(
		1,
		WaveformPreamble::FORMAT_WORD,
		RawSampleBuffer::BYTE_ORDER_LSB_FIRST,
		RawSampleBuffer::SAMPLES_UNSIGNED);

	vector<string> expected =
	{
		":WAV:SOUR CHAN1",
		":WAV:FORM WORD",
		":WAV:BYT LSBF",
		":WAV:UNS 1",
		":WAV:POIN:MODE RAW"
	};
	EXPECT_EQ(m_transport->GetCommands(), expected);

	m_transport->SetReply(":WAV:PRE?", "+1,+0,+2,+1,+1.0E-06,+0.0E+00,+0,+1.0E+00,+0.0E+00,+0");
	m_transport->SetRawReply(":WAV:DATA?", MockTransport::MakeBlock({0x01, 0x00, 0x02, 0x00}));

	auto preamble = m_scope->QueryPreamble();
	auto samples = m_scope->QueryWaveformData();
	ASSERT_FALSE(samples.IsAscii());
	EXPECT_EQ(samples.GetBytes().size(), 4u);

	auto trace = WaveformDecoder::Decode(
		preamble,
		samples,
		RawSampleBuffer::BYTE_ORDER_LSB_FIRST,
		RawSampleBuffer::SAMPLES_UNSIGNED);
	ASSERT_EQ(trace.size(), 2u);
	EXPECT_DOUBLE_EQ(trace.GetVoltage()[0], 1);
	EXPECT_DOUBLE_EQ(trace.GetVoltage()[1], 2);
}

TEST_F(KeysightDSOX3024ATest, AsciiRead)
{
	m_scope->ConfigureWaveformTransfer(
		3,
		WaveformPreamble::FORMAT_ASCII,
		RawSampleBuffer::BYTE_ORDER_MSB_FIRST,
		RawSampleBuffer::SAMPLES_SIGNED);
	EXPECT_TRUE(m_transport->HasCommand(":WAV:FORM ASC"));
	EXPECT_TRUE(m_transport->HasCommand(":WAV:SOUR CHAN3"));

	m_transport->SetReply(":WAV:DATA?", "#800000029 1.25000e-01, -2.50000e-01,5.0E-01");
	auto samples = m_scope->QueryWaveformData();

	ASSERT_TRUE(samples.IsAscii());
	vector<double> expected = {0.125, -0.25, 0.5};
	EXPECT_EQ(samples.GetAsciiValues(), expected);
}

TEST_F(KeysightDSOX3024ATest, AcquisitionCommands)
{
	m_scope->SetAcquisitionType(WaveformPreamble::TYPE_NORMAL);
	m_scope->Autoscale();
	m_scope->InitiateAcquisition();

	vector<string> expected = {":ACQ:TYPE NORM", ":AUT", ":SING"};
	EXPECT_EQ(m_transport->GetCommands(), expected);
}

TEST_F(KeysightDSOX3024ATest, TruncatedBlockIsATransportFailure)
{
	m_transport->SetRawReply(":WAV:DATA?", {'#', '1', '8', 0x01, 0x02});
	EXPECT_THROW(m_scope->QueryWaveformData(), TransportFailureError);
}

TEST_F(KeysightDSOX3024ATest, BadBlockHeaderIsATransportFailure)
{
	m_transport->SetRawReply(":WAV:DATA?", {'X', '1', '2', 0x01, 0x02, '\n'});
	EXPECT_THROW(m_scope->QueryWaveformData(), TransportFailureError);
}
