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
	@brief Command text produced by the Keysight 81150A driver
 */

#include <gtest/gtest.h>

#include "MockTransport.h"

using namespace std;

class Keysight81150ATest : public testing::Test
{
protected:
	void SetUp() override
	{
		m_transport = new MockTransport("Agilent Technologies,81150A,MY12345678,2.0.0.0-2.5");
		m_gen.reset(new Keysight81150AFunctionGenerator(m_transport, GeneratorModelConfig::Keysight81150A()));
		m_transport->ClearCommands();
	}

	MockTransport* m_transport;
	unique_ptr<Keysight81150AFunctionGenerator> m_gen;
};

TEST_F(Keysight81150ATest, Identification)
{
	EXPECT_EQ(m_gen->GetVendor(), "Agilent Technologies");
	EXPECT_EQ(m_gen->GetName(), "81150A");
	EXPECT_EQ(m_gen->GetSerial(), "MY12345678");
	EXPECT_EQ(m_gen->GetFirmwareVersion(), "2.0.0.0-2.5");
	EXPECT_EQ(m_gen->GetDriverName(), "keysight_81150a");
	EXPECT_EQ(m_gen->GetTransportName(), "mock");
	EXPECT_EQ(m_gen->GetInstrumentTypes(), (unsigned int)Instrument::INST_FUNCTION);
	EXPECT_EQ(m_gen->GetFunctionChannelCount(), 2u);
}

TEST_F(Keysight81150ATest, ResetAndInitialize)
{
	m_gen->Reset();
	m_gen->Initialize();
	vector<string> expected = {"*RST", "*RST", "*CLS"};
	EXPECT_EQ(m_transport->GetCommands(), expected);
}

TEST_F(Keysight81150ATest, SelectArbitraryWaveform)
{
	m_gen->SelectArbitraryWaveform(2, "PUND", 2.0, 0.5, 500);

	vector<string> expected =
	{
		":FUNC2:USER PUND",
		":FUNC2 USER",
		":VOLT2 2.000000e+00",
		":VOLT2:OFFS 5.000000e-01",
		":FREQ2 5.000000e+02"
	};
	EXPECT_EQ(m_transport->GetCommands(), expected);
}

TEST_F(Keysight81150ATest, OutputAndTrigger)
{
	m_gen->CoupleChannels();
	m_gen->ConfigureImpedance(1, 50, 50);
	m_gen->ConfigureTrigger(1, "MAN");
	m_gen->SetOutputEnabled(1, true);
	m_gen->SendSoftwareTrigger();

	vector<string> expected =
	{
		":TRAC:CHAN1 ON",
		":OUTP1:IMP 5.000000e+01",
		":OUTP1:LOAD 5.000000e+01",
		":ARM:SOUR1 MAN",
		":ARM:SLOP1 POSitive",
		":INIT1:CONT OFF",
		":ARM:SENS1 EDGE",
		":TRIG1:COUN 1",
		":OUTP1 ON",
		"*TRG"
	};
	EXPECT_EQ(m_transport->GetCommands(), expected);
}

TEST_F(Keysight81150ATest, ContinuousTrigger)
{
	m_gen->ConfigureTrigger(2, "IMM", "CONT", "NEG");

	vector<string> expected =
	{
		":ARM:SOUR2 IMM",
		":ARM:SLOP2 NEG",
		":INIT2:CONT ON"
	};
	EXPECT_EQ(m_transport->GetCommands(), expected);
}

TEST_F(Keysight81150ATest, RejectsValuesBeforeSending)
{
	//channel 3 does not exist
	EXPECT_THROW(m_gen->SetOutputEnabled(3, true), ParameterNotInSetError);

	//amplitude and frequency limits
	EXPECT_THROW(m_gen->SelectArbitraryWaveform(1, "PUND", 50, 0, 1000), ParameterOutOfRangeError);
	EXPECT_THROW(m_gen->SelectArbitraryWaveform(1, "PUND", 1e-3, 0, 1000), ParameterOutOfRangeError);
	EXPECT_THROW(m_gen->SelectArbitraryWaveform(1, "PUND", 1, 0, 200e6), ParameterOutOfRangeError);

	//impedance choices
	EXPECT_THROW(m_gen->ConfigureImpedance(1, 75, 50), ParameterNotInSetError);
	EXPECT_THROW(m_gen->ConfigureTrigger(1, "BOGUS"), ParameterNotInSetError);

	//bad waveform name
	EXPECT_THROW(m_gen->StoreArbitraryWaveform(1, "1PUND"), ParameterNotInSetError);
	EXPECT_THROW(m_gen->StoreArbitraryWaveform(1, "WAY_TOO_LONG_NAME"), ParameterNotInSetError);
	EXPECT_THROW(m_gen->StoreArbitraryWaveform(1, "\xc3\x89" "CHO"), ParameterNotInSetError);
	EXPECT_THROW(m_gen->StoreArbitraryWaveform(1, "PUND_\xb5s"), ParameterNotInSetError);

	EXPECT_TRUE(m_transport->GetCommands().empty());
}

TEST_F(Keysight81150ATest, ParameterErrorsNameTheParameter)
{
	try
	{
		m_gen->SelectArbitraryWaveform(1, "PUND", 1, 0, 200e6);
		FAIL() << "200 MHz accepted";
	}
	catch(const ParameterOutOfRangeError& e)
	{
		EXPECT_EQ(e.GetParameterName(), "frequency_arb");
	}
}

TEST_F(Keysight81150ATest, UploadRejectsBadTables)
{
	EXPECT_THROW(m_gen->UploadArbitraryWaveform(1, {0}), ParameterOutOfRangeError);
	EXPECT_THROW(m_gen->UploadArbitraryWaveform(1, {0, 9000}), ParameterOutOfRangeError);
	EXPECT_THROW(
		m_gen->UploadArbitraryWaveform(1, vector<double>(m_gen->GetMaxArbPoints() + 1, 0)),
		ParameterOutOfRangeError);

	EXPECT_TRUE(m_transport->GetRawWrites().empty());
}

TEST_F(Keysight81150ATest, StoreChecksFreeSlots)
{
	m_transport->SetReply(":DATA1:NVOL:FREE?", "2");
	EXPECT_TRUE(m_gen->StoreArbitraryWaveform(1, "HYSTERESIS"));
	EXPECT_TRUE(m_transport->HasCommand(":DATA1:COPY HYSTERESIS, VOLATILE"));

	m_transport->SetReply(":DATA1:NVOL:FREE?", "0");
	m_transport->ClearCommands();
	EXPECT_FALSE(m_gen->StoreArbitraryWaveform(1, "HYSTERESIS"));
	EXPECT_FALSE(m_transport->HasCommand(":DATA1:COPY HYSTERESIS, VOLATILE"));

	m_transport->SetReply(":DATA1:NVOL:FREE?", "lots");
	EXPECT_THROW(m_gen->StoreArbitraryWaveform(1, "HYSTERESIS"), TransportFailureError);
}

TEST_F(Keysight81150ATest, TransportFailurePropagates)
{
	m_transport->FailOn("*TRG");
	EXPECT_THROW(m_gen->SendSoftwareTrigger(), TransportFailureError);
}

TEST(Keysight81150AFactory, CreatesFromRegistry)
{
	auto transport = new MockTransport("Agilent Technologies,81150A,MY12345678,2.0.0.0-2.5");

	YAML::Node model = YAML::Load("{max_arb_points: 1000, limits: {voltage: {range: [0.1, 5]}}}");
	unique_ptr<FunctionGenerator> gen(
		FunctionGenerator::CreateFunctionGenerator("keysight_81150a", transport, model));
	ASSERT_TRUE(gen != nullptr);

	EXPECT_EQ(gen->GetMaxArbPoints(), 1000u);
	EXPECT_DOUBLE_EQ(gen->GetArbResolution(), 5e-10);
	EXPECT_THROW(gen->SelectArbitraryWaveform(1, "PUND", 6, 0, 1000), ParameterOutOfRangeError);

	vector<string> drivers;
	FunctionGenerator::EnumDrivers(drivers);
	EXPECT_EQ(drivers, vector<string>{"keysight_81150a"});

	MockTransport unused;
	EXPECT_EQ(FunctionGenerator::CreateFunctionGenerator("no_such_driver", &unused, YAML::Node()), nullptr);
}
