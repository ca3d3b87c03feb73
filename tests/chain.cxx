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

#include <memory>
#include <stdexcept>
#include <vector>
#include "core/partition.h"
#include "smooth/density.h"
#include "group/chain.h"
#include "group/exchange.h"

using namespace hopchain;

namespace {

// Particles on a line where each one sees itself and the particles on
// either side. Densities are given rather than estimated.
class LineIndex : public NeighborIndex {
    std::vector<double> rho;
public:
    explicit LineIndex(std::vector<double> rho) : rho(std::move(rho)) {}
    int maxNeighbors() const override {return 3;}
    double density(int i) override {return rho[i];}
    int neighbors(int i, std::int32_t *list) override {
        int n = 0;
        list[n++] = i;
        if (i > 0) list[n++] = i - 1;
        if (i+1 < int(rho.size())) list[n++] = i + 1;
        return n;
    }
};

class ChainTest : public ::testing::Test {
protected:
    std::unique_ptr<Partition> part;

    // nInside particles spaced along x in a single domain of [0,1); the
    // rest are placed past the upper edge, in the padding.
    void Load(const std::vector<double> &rho, int nInside) {
        DecompParameters p;
        for (auto d=0; d<3; ++d) {
            p.nGrid[d] = 1;
            p.bPeriodic[d] = 0;
        }
        p.dBoxSize = 1.0;
        p.dPadding = 0.5;
        Decomposition decomp(p,1);
        part = std::make_unique<Partition>(0,decomp);
        std::vector<std::int64_t> g;
        std::vector<Partition::coord_type> r;
        std::vector<double> m;
        for (auto i=0u; i<rho.size(); ++i) {
            auto x = int(i) < nInside ? 0.05 + 0.9 * i / nInside : 1.0 + 0.01 * (i - nInside);
            g.push_back(100 + i);
            r.push_back(Partition::coord_type(x,0.5,0.5));
            m.push_back(1.0);
        }
        part->SetParticles(g,r,m);
        part->SetIndex(std::make_unique<LineIndex>(rho));
        ComputeDensity(*part);
    }
};

TEST_F(ChainTest, DensestNeighbor) {
    Load({1,2,3,10,9,8,0.5,0.2,7,6},10);
    std::vector<std::int32_t> expected = {1,2,3,3,3,4,5,8,8,8};
    for (auto i=0; i<10; ++i) EXPECT_EQ(part->densestNN[i],expected[i]) << "particle " << i;
}

TEST_F(ChainTest, DensestNeighborTieKeepsListOrder) {
    Load({1,5,5,1},4);
    // Equal densities keep whichever comes first in the list, here the particle itself
    EXPECT_EQ(part->densestNN[0],1);
    EXPECT_EQ(part->densestNN[1],1);
    EXPECT_EQ(part->densestNN[2],2);
    EXPECT_EQ(part->densestNN[3],2);
}

TEST_F(ChainTest, LineScenario) {
    Load({1,2,3,10,9,8,0.5,0.2,7,6},10);
    auto nChains = BuildChains(*part,3.0);
    EXPECT_EQ(nChains,2);
    std::vector<std::int64_t> expected = {-1,-1,0,0,0,0,-1,-1,1,1};
    for (auto i=0; i<10; ++i) EXPECT_EQ(part->chainID[i],expected[i]) << "particle " << i;
    EXPECT_TRUE(part->paddedTerminals.empty());
    EXPECT_EQ(part->nLocalChains,2);
}

TEST_F(ChainTest, ThresholdIsInclusive) {
    Load({1,2,3,10,9,8,0.5,0.2,7,6},10);
    BuildChains(*part,10.0);
    EXPECT_EQ(part->chainID[3],0);
    EXPECT_EQ(part->chainID[4],-1);
}

TEST_F(ChainTest, ChainsEndAtPaddedParticles) {
    // The last two particles are ghosts beyond the upper edge
    Load({1,4,5,6,7,8},4);
    auto nChains = BuildChains(*part,2.0);
    EXPECT_EQ(nChains,1);
    ASSERT_EQ(part->paddedTerminals.size(),1u);
    auto t = part->paddedTerminals[0];
    EXPECT_FALSE(part->inside(t));
    EXPECT_EQ(t,4);
    for (auto i=1; i<=4; ++i) EXPECT_EQ(part->chainID[i],0);
    EXPECT_EQ(part->chainID[0],-1);
    // The ghost past the terminal is never visited
    EXPECT_EQ(part->chainID[5],-1);
}

TEST_F(ChainTest, NonPositiveThresholdThrows) {
    Load({1,2,3},3);
    EXPECT_THROW(BuildChains(*part,0.0),std::domain_error);
    EXPECT_THROW(BuildChains(*part,-1.0),std::domain_error);
}

TEST(ChainAliasTest, JoinsResolveToTheSmallestId) {
    ChainAlias alias;
    EXPECT_TRUE(alias.empty());
    EXPECT_EQ(alias.find(5),5);
    alias.join(5,3);
    alias.join(3,1);
    EXPECT_EQ(alias.find(5),1);
    EXPECT_EQ(alias.find(3),1);
    // Order of the arguments does not matter
    alias.join(7,9);
    EXPECT_EQ(alias.find(9),7);
    alias.join(9,5);
    EXPECT_EQ(alias.find(7),1);
    EXPECT_EQ(alias.find(2),2);
    EXPECT_FALSE(alias.empty());
}

TEST(DensityTest, MissingIndexThrows) {
    DecompParameters p;
    for (auto d=0; d<3; ++d) {
        p.nGrid[d] = 1;
        p.bPeriodic[d] = 1;
    }
    p.dBoxSize = 1.0;
    p.dPadding = 0.1;
    Partition part(0,Decomposition(p,1));
    EXPECT_THROW(ComputeDensity(part),std::logic_error);
    EXPECT_THROW(BuildNeighborIndex(part,0),std::domain_error);
    EXPECT_THROW(BuildNeighborIndex(part,4),std::domain_error);
}

} // namespace
