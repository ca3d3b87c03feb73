/*  This file is part of PKDGRAV3 (http://www.pkdgrav.org/).
 *  Copyright (c) 2001-2018 Joachim Stadel & Douglas Potter
 *
 *  PKDGRAV3 is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  PKDGRAV3 is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with PKDGRAV3.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "gtest/gtest.h"

#include <vector>
#include "group/assemble.h"
#include "group/graph.h"

using namespace hopchain;

namespace {

class AssembleTest : public ::testing::Test {
protected:
    std::vector<ChainPeak> peaks;
    std::vector<ChainEdge> edges;
    void SetUp() override {
        // chain, densest member, members, peak density
        peaks = {
            {0, 1000, 50, 100.0},
            {1, 1001, 40,  80.0},
            {2, 1002, 10,  20.0},
            {3, 1003, 30,  60.0},
            {4, 1004,  5,  10.0},
            {5, 1005,  7,  15.0},
        };
        edges = {
            {0, 1, 40.0},
            {0, 3, 20.0},
            {1, 2, 15.0},
            {3, 2, 12.0},
            {2, 4,  8.0},
        };
    }
};

TEST_F(AssembleTest, MergeAndAttach) {
    GroupAssembler assembler(peaks,30.0,25.0);
    assembler.Merge(edges);
    EXPECT_EQ(assembler.Groups(),2);
    std::vector<std::int64_t> expected = {0,0,0,1,0,-1};
    EXPECT_EQ(assembler.ReverseMap(),expected);
    EXPECT_DOUBLE_EQ(assembler.DensestBound()[2],15.0);
    // Limited by the weaker of the two boundaries on the way
    EXPECT_DOUBLE_EQ(assembler.DensestBound()[4],8.0);
    EXPECT_LT(assembler.DensestBound()[5],0.0);
}

TEST_F(AssembleTest, SaddleThresholdIsInclusive) {
    edges[1].fDensity = 25.0;
    GroupAssembler assembler(peaks,30.0,25.0);
    assembler.Merge(edges);
    EXPECT_EQ(assembler.Groups(),1);
    EXPECT_EQ(assembler.ReverseMap()[3],0);
}

TEST_F(AssembleTest, PeakThresholdIsInclusive) {
    // Chain 2 now seeds its own group but is too weakly joined to merge
    GroupAssembler assembler(peaks,20.0,25.0);
    assembler.Merge(edges);
    EXPECT_EQ(assembler.Groups(),3);
    std::vector<std::int64_t> expected = {0,0,1,2,1,-1};
    EXPECT_EQ(assembler.ReverseMap(),expected);
}

TEST_F(AssembleTest, AttachToDensestBoundary) {
    edges[3].fDensity = 18.0;   // chain 2 now shares more with chain 3
    GroupAssembler assembler(peaks,30.0,25.0);
    assembler.Merge(edges);
    std::vector<std::int64_t> expected = {0,0,1,1,1,-1};
    EXPECT_EQ(assembler.ReverseMap(),expected);
}

TEST_F(AssembleTest, EmptyChainsNeverSeed) {
    peaks[5] = {5, -1, 0, -1.0};
    edges.push_back({0, 5, 50.0});
    GroupAssembler assembler(peaks,30.0,25.0);
    assembler.Merge(edges);
    EXPECT_EQ(assembler.Groups(),2);
}

TEST_F(AssembleTest, Purge) {
    GroupAssembler assembler(peaks,30.0,25.0);
    assembler.Merge(edges);
    EXPECT_EQ(assembler.Purge(0),0);
    EXPECT_EQ(assembler.Groups(),2);
    EXPECT_EQ(assembler.Purge(50),1);   // 105 and 30 members
    EXPECT_EQ(assembler.Groups(),1);
    std::vector<std::int64_t> expected = {0,0,0,-1,0,-1};
    EXPECT_EQ(assembler.ReverseMap(),expected);
}

TEST(CompactTest, RenumbersInOrderAndIsIdempotent) {
    std::vector<std::int64_t> map = {7,-1,3,7,9};
    EXPECT_EQ(GroupAssembler::Compact(map),3);
    std::vector<std::int64_t> expected = {1,-1,0,1,2};
    EXPECT_EQ(map,expected);
    EXPECT_EQ(GroupAssembler::Compact(map),3);
    EXPECT_EQ(map,expected);
}

TEST(DenserPeakTest, TiesGoToTheLowerId) {
    std::vector<ChainPeak> peaks = {{0,0,1,5.0},{1,1,1,5.0},{2,2,1,6.0}};
    EXPECT_TRUE(denser_peak(peaks,0,1));
    EXPECT_FALSE(denser_peak(peaks,1,0));
    EXPECT_TRUE(denser_peak(peaks,2,0));
}

} // namespace
