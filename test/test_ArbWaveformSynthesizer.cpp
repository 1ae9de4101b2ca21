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
	@brief Tests for ArbWaveformSynthesizer
 */

#include <gtest/gtest.h>

#include <cmath>

#include "../ferrohal/ferrohal.h"

using namespace std;

TEST(ArbWaveformSynthesizer, DensifySingleRamp)
{
	auto dense = ArbWaveformSynthesizer::Densify({{0, 0}, {1, 1}}, 10);

	ASSERT_EQ(dense.size(), 10u);
	for(size_t i=0; i<10; i++)
		EXPECT_NEAR(dense[i], i * 0.1, 1e-12);
	for(size_t i=1; i<10; i++)
		EXPECT_GT(dense[i], dense[i-1]);
	EXPECT_LT(dense.back(), 1.0);
}

TEST(ArbWaveformSynthesizer, DensifySplitsPointsByDuration)
{
	//first segment is a quarter of the total
	auto dense = ArbWaveformSynthesizer::Densify({{0, 0}, {1, 4}, {4, 4}}, 8);

	ASSERT_EQ(dense.size(), 8u);
	EXPECT_DOUBLE_EQ(dense[0], 0);
	EXPECT_DOUBLE_EQ(dense[1], 2);
	for(size_t i=2; i<8; i++)
		EXPECT_DOUBLE_EQ(dense[i], 4);
}

TEST(ArbWaveformSynthesizer, DensifyPadsShortfall)
{
	//each segment rounds 3.33 points down to 3, leaving one point to pad
	auto dense = ArbWaveformSynthesizer::Densify({{0, 0}, {1, 1}, {2, 2}, {3, 0}}, 10);

	ASSERT_EQ(dense.size(), 10u);
	EXPECT_NEAR(dense[8], 2.0/3, 1e-12);
	EXPECT_DOUBLE_EQ(dense[9], dense[8]);
}

TEST(ArbWaveformSynthesizer, DensifyTruncatesExcess)
{
	//each segment rounds 2.5 points up to 3, one point too many
	auto dense = ArbWaveformSynthesizer::Densify({{0, 0}, {1, 1}, {2, 0}}, 5);

	ASSERT_EQ(dense.size(), 5u);
	EXPECT_DOUBLE_EQ(dense[0], 0);
	EXPECT_DOUBLE_EQ(dense[3], 1);
	EXPECT_NEAR(dense[4], 2.0/3, 1e-12);
}

TEST(ArbWaveformSynthesizer, DensifyRejectsBadBreakpoints)
{
	EXPECT_THROW(ArbWaveformSynthesizer::Densify({{0, 0}}, 10), InvalidBreakpointsError);
	EXPECT_THROW(ArbWaveformSynthesizer::Densify({}, 10), InvalidBreakpointsError);
	EXPECT_THROW(ArbWaveformSynthesizer::Densify({{0, 0}, {0.5, 1}, {0.3, 0}}, 10), InvalidBreakpointsError);
	EXPECT_THROW(ArbWaveformSynthesizer::Densify({{0, 0}, {0, 1}}, 10), InvalidBreakpointsError);
	EXPECT_THROW(ArbWaveformSynthesizer::Densify({{-1, 0}, {1, 1}}, 10), InvalidBreakpointsError);
	EXPECT_THROW(ArbWaveformSynthesizer::Densify({{0, 0}, {NAN, 1}}, 10), InvalidBreakpointsError);

	//fewer points than breakpoints
	EXPECT_THROW(ArbWaveformSynthesizer::Densify({{0, 0}, {1, 1}, {2, 0}}, 2), InvalidBreakpointsError);
}

TEST(ArbWaveformSynthesizer, ScaleToDeviceCodes)
{
	auto codes = ArbWaveformSynthesizer::ScaleToDeviceCodes({0, 1, 2}, 8191);

	ASSERT_EQ(codes.size(), 3u);
	EXPECT_DOUBLE_EQ(codes[0], -8191);
	EXPECT_DOUBLE_EQ(codes[1], 0);
	EXPECT_DOUBLE_EQ(codes[2], 8191);
}

TEST(ArbWaveformSynthesizer, ScaleUsesObservedExtremes)
{
	auto codes = ArbWaveformSynthesizer::ScaleToDeviceCodes({-3, 1, -1, 5}, 100);

	EXPECT_DOUBLE_EQ(codes[0], -100);
	EXPECT_DOUBLE_EQ(codes[1], 0);
	EXPECT_DOUBLE_EQ(codes[2], -50);
	EXPECT_DOUBLE_EQ(codes[3], 100);
}

TEST(ArbWaveformSynthesizer, ScaleRejectsDegenerateInput)
{
	EXPECT_THROW(ArbWaveformSynthesizer::ScaleToDeviceCodes({5, 5, 5}, 8191), DegenerateRangeError);
	EXPECT_THROW(ArbWaveformSynthesizer::ScaleToDeviceCodes({}, 8191), DegenerateRangeError);
}
