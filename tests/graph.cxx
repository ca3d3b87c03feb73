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

#include <algorithm>
#include <memory>
#include <vector>
#include "core/partition.h"
#include "smooth/density.h"
#include "group/chain.h"
#include "group/exchange.h"
#include "group/graph.h"
#include "group/assemble.h"
#include "solomdl.h"

using namespace hopchain;

namespace {

// Densities and neighbour lists given directly
class ListIndex : public NeighborIndex {
    std::vector<double> rho;
    std::vector<std::vector<std::int32_t>> lists;
    int nMax = 0;
public:
    ListIndex(std::vector<double> rho, std::vector<std::vector<std::int32_t>> lists)
        : rho(std::move(rho)), lists(std::move(lists)) {
        for (auto &l : this->lists) nMax = std::max(nMax,int(l.size()));
    }
    int maxNeighbors() const override {return nMax;}
    double density(int i) override {return rho[i];}
    int neighbors(int i, std::int32_t *list) override {
        std::copy(lists[i].begin(),lists[i].end(),list);
        return lists[i].size();
    }
};

class GraphTest : public ::testing::Test {
protected:
    SoloMDL mdl;
    std::unique_ptr<Partition> part;

    // One domain covering [0,1). Particles at x >= 1 sit in the padding;
    // with periodic boundaries they are images of particles this worker owns.
    void Load(const std::vector<double> &x, const std::vector<std::int64_t> &g,
              const std::vector<double> &rho, std::vector<std::vector<std::int32_t>> lists,
              double dThreshold, bool bPeriodic=true) {
        DecompParameters p;
        for (auto d=0; d<3; ++d) {
            p.nGrid[d] = 1;
            p.bPeriodic[d] = bPeriodic;
        }
        p.dBoxSize = 1.0;
        p.dPadding = 0.5;
        part = std::make_unique<Partition>(0,Decomposition(p,1));
        std::vector<Partition::coord_type> r;
        for (auto xi : x) r.push_back(Partition::coord_type(xi,0.5,0.5));
        part->SetParticles(g,r,std::vector<double>(x.size(),1.0));
        part->SetIndex(std::make_unique<ListIndex>(rho,std::move(lists)));
        ComputeDensity(*part);
        BuildChains(*part,dThreshold);
        AssignGlobalChainIDs(*part,&mdl);
    }

    // Two chains, {0,1} under peak 0 and {2,3,4} under peak 3; 5 is below threshold
    void LoadTwoChains() {
        Load({0.1,0.2,0.3,0.4,0.5,0.6},{100,101,102,103,104,105},
             {10,8,6,9,7,1},
             {{0,1,5},{1,0,2},{2,3,1},{3,4,1},{4,3,1},{5,4,3}},2.0);
    }
};

TEST_F(GraphTest, TwoChains) {
    LoadTwoChains();
    std::vector<std::int64_t> expected = {0,0,1,1,1,-1};
    for (auto i=0; i<6; ++i) EXPECT_EQ(part->chainID[i],expected[i]) << "particle " << i;
    EXPECT_EQ(part->nGlobalChains,2);
}

TEST_F(GraphTest, OnlyTheFirstNMergePlusTwoNeighboursAreExamined) {
    LoadTwoChains();
    // Two entries per list: each particle and its densest neighbour, both in its own chain
    EXPECT_TRUE(FindLocalEdges(*part,&mdl,0).empty());
    EXPECT_EQ(FindLocalEdges(*part,&mdl,1).size(),1u);
}

TEST_F(GraphTest, EdgeKeepsTheDensestBoundaryMean) {
    LoadTwoChains();
    // Boundary pairs in visiting order: (1,2) 7, (2,1) 7, (3,1) 8.5, (4,1) 7.5
    auto edges = FindLocalEdges(*part,&mdl,1);
    ASSERT_EQ(edges.size(),1u);
    EXPECT_EQ(edges[0].iHigh,0);
    EXPECT_EQ(edges[0].iLow,1);
    EXPECT_DOUBLE_EQ(edges[0].fDensity,8.5);
}

TEST_F(GraphTest, UnassignedGhostIsResolvedByItsOwner) {
    // Particle 6 is a periodic image of particle 3. It is in the lists of
    // particles 0 and 1 but is never on a chain path here.
    Load({0.1,0.2,0.3,0.4,0.5,0.6,1.02},{100,101,102,103,104,105,103},
         {10,8,6,9,7,1,9},
         {{0,1,6},{1,0,6},{2,3,1},{3,4,2},{4,3,1},{5,4,3},{6,0,1}},2.0);
    EXPECT_FALSE(part->inside(6));
    EXPECT_EQ(part->chainID[6],-1);
    EXPECT_TRUE(part->paddedTerminals.empty());

    auto edges = FindLocalEdges(*part,&mdl,1);
    ASSERT_EQ(edges.size(),1u);
    // Densest chain 0 endpoint of the ghost (10) with the owner's density (9).
    // Direct boundaries only reach 7.5.
    EXPECT_DOUBLE_EQ(edges[0].fDensity,9.5);
}

TEST_F(GraphTest, PeakTableTieGoesToTheLowerIndex) {
    // Particle 1 points at particle 0, which has the same density
    Load({0.1,0.2,0.3},{201,200,202},{5,5,3},{{0,1},{0,1},{2,0}},1.0);
    for (auto i=0; i<3; ++i) EXPECT_EQ(part->chainID[i],0);
    auto peaks = BuildPeakTable(*part,&mdl);
    ASSERT_EQ(peaks.size(),1u);
    EXPECT_EQ(peaks[0].nMembers,3);
    EXPECT_DOUBLE_EQ(peaks[0].fDensity,5.0);
    EXPECT_EQ(peaks[0].iGlobal,200);
}

TEST_F(GraphTest, LineScenarioSeedsOnlyTheDensePeak) {
    std::vector<double> rho = {1,2,3,10,9,8,0.5,0.2,7,6};
    std::vector<double> x;
    std::vector<std::int64_t> g;
    std::vector<std::vector<std::int32_t>> lists;
    for (auto i=0; i<10; ++i) {
        x.push_back(0.05 + 0.09*i);
        g.push_back(100 + i);
        std::vector<std::int32_t> l = {i};
        if (i > 0) l.push_back(i-1);
        if (i < 9) l.push_back(i+1);
        lists.push_back(l);
    }
    const double dThreshold = 3.0;
    Load(x,g,rho,lists,dThreshold);
    auto peaks = BuildPeakTable(*part,&mdl);
    ASSERT_EQ(peaks.size(),2u);
    EXPECT_DOUBLE_EQ(peaks[0].fDensity,10.0);
    EXPECT_DOUBLE_EQ(peaks[1].fDensity,7.0);
    auto edges = MergeEdges(FindLocalEdges(*part,&mdl,1),peaks,&mdl);
    EXPECT_TRUE(edges.empty());

    GroupAssembler assembler(peaks,3.0*dThreshold,2.5*dThreshold);
    assembler.Merge(edges);
    EXPECT_EQ(assembler.Groups(),1);
    EXPECT_EQ(assembler.ReverseMap(),(std::vector<std::int64_t>{0,-1}));

    std::vector<std::int64_t> expected = {-1,-1,0,0,0,0,-1,-1,-1,-1};
    for (auto i=0; i<10; ++i) {
        auto c = part->chainID[i];
        auto group = c < 0 ? Partition::NONE : assembler.ReverseMap()[c];
        EXPECT_EQ(group,expected[i]) << "particle " << i;
        if (rho[i] < dThreshold) EXPECT_EQ(group,Partition::NONE);
    }
}

TEST_F(GraphTest, ExchangeCountsEachUnownedRecordOncePerRound) {
    // Non periodic: the terminal ghost past the upper edge has no owner
    Load({0.2,0.4,0.6,0.8,1.02},{100,101,102,103,104},
         {4,5,6,7,8},
         {{0,1},{1,0,2},{2,1,3},{3,2,4},{4,3}},1.0,false);
    ASSERT_EQ(part->paddedTerminals.size(),1u);
    for (auto round=0; round<2; ++round) {
        auto stats = ExchangeRound(*part,&mdl);
        EXPECT_EQ(stats.nDropped,1u);
        EXPECT_EQ(stats.nSent,0u);
        EXPECT_EQ(stats.nChanged,0u);
    }
}

} // namespace
