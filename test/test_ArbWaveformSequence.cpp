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
	@brief Tests for ArbWaveformSequence
 */

#include <gtest/gtest.h>

#include "MockTransport.h"

using namespace std;

static const char* g_generatorIDN = "Agilent Technologies,81150A,MY12345678,2.0.0.0-2.5";

class ArbWaveformSequenceTest : public testing::Test
{
protected:
	void SetUp() override
	{
		m_transport = new MockTransport(g_generatorIDN);
		m_gen.reset(new Keysight81150AFunctionGenerator(m_transport, GeneratorModelConfig::Keysight81150A()));
		m_transport->ClearCommands();
	}

	void Prepare(ArbWaveformSequence& seq)
	{
		seq.SetBreakpoints({{0, 0}, {1, 1}});
		seq.Densify(10);
		seq.Scale(m_gen->GetArbFullScaleCode());
		seq.Upload(*m_gen, 1);
	}

	//owned by m_gen
	MockTransport* m_transport;
	unique_ptr<Keysight81150AFunctionGenerator> m_gen;
};

TEST_F(ArbWaveformSequenceTest, StoresWhenSlotFree)
{
	m_transport->SetReply(":DATA1:NVOL:FREE?", "3");

	ArbWaveformSequence seq;
	EXPECT_EQ(seq.GetState(), ArbWaveformSequence::STATE_IDLE);
	Prepare(seq);
	EXPECT_EQ(seq.GetState(), ArbWaveformSequence::STATE_UPLOADED_VOLATILE);
	EXPECT_EQ(seq.GetWaveformName(), "VOLATILE");

	EXPECT_TRUE(seq.Store(*m_gen, 1, "PUND"));
	EXPECT_EQ(seq.GetState(), ArbWaveformSequence::STATE_NAMED);
	EXPECT_TRUE(seq.IsStored());
	EXPECT_TRUE(m_transport->HasCommand(":DATA1:COPY PUND, VOLATILE"));

	seq.ConfigureOnChannel(*m_gen, 1, 2.0, 0.0, 500);
	EXPECT_EQ(seq.GetState(), ArbWaveformSequence::STATE_CONFIGURED_ON_CHANNEL);
	EXPECT_TRUE(m_transport->HasCommand(":FUNC1:USER PUND"));
}

TEST_F(ArbWaveformSequenceTest, FallsBackToVolatileWhenFull)
{
	m_transport->SetReply(":DATA1:NVOL:FREE?", "0");

	ArbWaveformSequence seq;
	Prepare(seq);

	EXPECT_FALSE(seq.Store(*m_gen, 1, "PUND"));
	EXPECT_EQ(seq.GetState(), ArbWaveformSequence::STATE_UPLOADED_VOLATILE);
	EXPECT_FALSE(seq.IsStored());
	EXPECT_FALSE(m_transport->HasCommand(":DATA1:COPY PUND, VOLATILE"));

	seq.ConfigureOnChannel(*m_gen, 1, 2.0, 0.0, 500);
	EXPECT_EQ(seq.GetState(), ArbWaveformSequence::STATE_CONFIGURED_ON_CHANNEL);
	EXPECT_TRUE(m_transport->HasCommand(":FUNC1:USER VOLATILE"));
}

TEST_F(ArbWaveformSequenceTest, UploadsBigEndianCodes)
{
	ArbWaveformSequence seq;
	Prepare(seq);

	ASSERT_EQ(m_transport->GetRawWrites().size(), 1u);
	auto& block = m_transport->GetRawWrites()[0];

	string header = ":DATA1:DAC VOLATILE, #220";
	ASSERT_EQ(block.size(), header.length() + 20 + 1);
	EXPECT_EQ(string(block.begin(), block.begin() + header.length()), header);

	//first sample is full negative scale, last is full positive
	EXPECT_EQ(block[header.length()], 0xe0);
	EXPECT_EQ(block[header.length() + 1], 0x01);
	EXPECT_EQ(block[header.length() + 18], 0x1f);
	EXPECT_EQ(block[header.length() + 19], 0xff);
	EXPECT_EQ(block.back(), '\n');

	EXPECT_LT(m_transport->IndexOf(":FORM:BORD NORM"), m_transport->IndexOf(":DATA1:DAC VOLATILE,"));
}

TEST_F(ArbWaveformSequenceTest, RejectsOutOfOrderCalls)
{
	ArbWaveformSequence seq;
	EXPECT_THROW(seq.Densify(10), SequenceStateError);
	EXPECT_THROW(seq.Scale(8191), SequenceStateError);
	EXPECT_THROW(seq.Upload(*m_gen, 1), SequenceStateError);
	EXPECT_THROW(seq.Store(*m_gen, 1, "PUND"), SequenceStateError);
	EXPECT_THROW(seq.ConfigureOnChannel(*m_gen, 1, 1, 0, 1000), SequenceStateError);

	seq.SetBreakpoints({{0, 0}, {1, 1}});
	EXPECT_THROW(seq.SetBreakpoints({{0, 0}, {1, 1}}), SequenceStateError);
	EXPECT_THROW(seq.Upload(*m_gen, 1), SequenceStateError);

	seq.Densify(10);
	EXPECT_THROW(seq.Densify(10), SequenceStateError);

	//nothing reached the instrument
	EXPECT_TRUE(m_transport->GetCommands().empty());
}

TEST_F(ArbWaveformSequenceTest, TransitionsAreOneWay)
{
	m_transport->SetReply(":DATA1:NVOL:FREE?", "1");

	ArbWaveformSequence seq;
	Prepare(seq);
	seq.Store(*m_gen, 1, "PUND");
	seq.ConfigureOnChannel(*m_gen, 1, 2.0, 0.0, 500);

	EXPECT_THROW(seq.Store(*m_gen, 1, "PUND"), SequenceStateError);
	EXPECT_THROW(seq.ConfigureOnChannel(*m_gen, 1, 2.0, 0.0, 500), SequenceStateError);
	EXPECT_THROW(seq.Upload(*m_gen, 1), SequenceStateError);
}

TEST_F(ArbWaveformSequenceTest, InvalidBreakpointsLeaveSequenceIdle)
{
	ArbWaveformSequence seq;
	EXPECT_THROW(seq.SetBreakpoints({{0, 0}}), InvalidBreakpointsError);
	EXPECT_EQ(seq.GetState(), ArbWaveformSequence::STATE_IDLE);
}
