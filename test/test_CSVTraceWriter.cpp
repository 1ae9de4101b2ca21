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
	@brief Tests of CSV trace export
 */

#include <gtest/gtest.h>

#include "../ferrohal/ferrohal.h"

#include <fstream>
#include <unistd.h>

using namespace std;

class CSVTraceWriterTest : public testing::Test
{
protected:
	void SetUp() override
	{
		char tmp[] = "/tmp/ferrohal-csv-XXXXXX";
		int fd = mkstemp(tmp);
		ASSERT_GE(fd, 0);
		close(fd);
		m_path = tmp;
	}

	void TearDown() override
	{
		unlink(m_path.c_str());
	}

	vector<string> ReadLines()
	{
		ifstream in(m_path);
		vector<string> ret;
		string line;
		while(getline(in, line))
			ret.push_back(line);
		return ret;
	}

	string m_path;
};

TEST_F(CSVTraceWriterTest, WritesHeaderAndRows)
{
	Trace trace({-1e-6, -5e-7, 0}, {0.01, 0.012, -0.246});
	CSVTraceWriter::Write(m_path, trace);

	auto lines = ReadLines();
	ASSERT_EQ(lines.size(), 4u);
	EXPECT_EQ(lines[0], "time (s),voltage (V)");
	EXPECT_EQ(lines[1], "-1.0000000000e-06,1.0000000000e-02");
	EXPECT_EQ(lines[2], "-5.0000000000e-07,1.2000000000e-02");
	EXPECT_EQ(lines[3], "0.0000000000e+00,-2.4600000000e-01");
}

TEST_F(CSVTraceWriterTest, ReplacesExistingFile)
{
	CSVTraceWriter::Write(m_path, Trace({0, 1, 2}, {0, 0, 0}));
	CSVTraceWriter::Write(m_path, Trace({5}, {6}));

	auto lines = ReadLines();
	ASSERT_EQ(lines.size(), 2u);
	EXPECT_EQ(lines[1], "5.0000000000e+00,6.0000000000e+00");
}

TEST_F(CSVTraceWriterTest, EmptyTraceWritesHeaderOnly)
{
	CSVTraceWriter::Write(m_path, Trace({}, {}));

	auto lines = ReadLines();
	ASSERT_EQ(lines.size(), 1u);
	EXPECT_EQ(lines[0], "time (s),voltage (V)");
}

TEST(CSVTraceWriter, UnwritablePath)
{
	Trace trace({0}, {0});
	EXPECT_THROW(CSVTraceWriter::Write("/nonexistent-directory/trace.csv", trace), ExportError);
}
