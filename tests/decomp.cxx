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

#include <set>
#include <stdexcept>
#include "core/shift.h"
#include "core/decomp.h"
#include "core/partition.h"

using namespace hopchain;

namespace {
DecompParameters params(int nx,int ny,int nz,bool bPeriodic,double dPadding=0.05) {
    DecompParameters p;
    p.nGrid[0] = nx; p.nGrid[1] = ny; p.nGrid[2] = nz;
    for (auto d=0; d<3; ++d) p.bPeriodic[d] = bPeriodic;
    p.dBoxSize = 1.0;
    p.dPadding = dPadding;
    return p;
}
}

TEST(ShiftTest, TableIsConsistent) {
    EXPECT_EQ(shift::index(0,0,0),shift::iSelf);
    for (auto i=0; i<shift::nShifts; ++i) {
        const auto &s = shift::table[i];
        EXPECT_EQ(shift::index(s[0],s[1],s[2]),i);
        const auto &o = shift::table[shift::opposite(i)];
        for (auto d=0; d<3; ++d) EXPECT_EQ(o[d],-s[d]);
    }
}

TEST(DecompTest, FactoriseSpreadsDomains) {
    auto n = Decomposition::factorise(8);
    EXPECT_EQ(n[0]*n[1]*n[2],8);
    EXPECT_EQ(n[0],2); EXPECT_EQ(n[1],2); EXPECT_EQ(n[2],2);
    n = Decomposition::factorise(2);
    EXPECT_EQ(n[0]*n[1]*n[2],2);
    n = Decomposition::factorise(7);
    EXPECT_EQ(n[0]*n[1]*n[2],7);
}

TEST(DecompTest, BoundsTileTheBox) {
    Decomposition decomp(params(2,3,1,true),6);
    double volume = 0.0;
    for (auto i=0; i<decomp.domains(); ++i) {
        auto b = decomp.bound(i);
        EXPECT_TRUE(b.valid());
        volume += b.width(0) * b.width(1) * b.width(2);
        EXPECT_EQ(decomp.id(decomp.coords(i)),i);
        EXPECT_EQ(decomp.owner(b.center()),i);
    }
    EXPECT_NEAR(volume,1.0,1e-12);
}

TEST(DecompTest, NeighborsWrapOnlyWhenPeriodic) {
    Decomposition periodic(params(2,1,1,true),2);
    Decomposition open(params(2,1,1,false),2);
    EXPECT_EQ(periodic.neighbor(0,shift::iSelf),0);
    EXPECT_EQ(periodic.neighbor(0,shift::index(1,0,0)),1);
    EXPECT_EQ(periodic.neighbor(0,shift::index(-1,0,0)),1);
    EXPECT_EQ(periodic.neighbor(0,shift::index(0,1,0)),0);
    EXPECT_EQ(open.neighbor(0,shift::index(1,0,0)),1);
    EXPECT_EQ(open.neighbor(0,shift::index(-1,0,0)),-1);
    EXPECT_EQ(open.neighbor(0,shift::index(0,0,1)),-1);
    // Every periodic neighbour relation is symmetric
    for (auto i=0; i<periodic.domains(); ++i) {
        for (auto s=0; s<shift::nShifts; ++s) {
            auto j = periodic.neighbor(i,s);
            EXPECT_EQ(periodic.neighbor(j,shift::opposite(s)),i);
        }
    }
}

TEST(DecompTest, OwnerWrapsPeriodicPositions) {
    Decomposition decomp(params(2,1,1,true),2);
    EXPECT_EQ(decomp.owner(Bound::coord_type(1.25,0.5,0.5)),0);
    EXPECT_EQ(decomp.owner(Bound::coord_type(-0.25,0.5,0.5)),1);
}

TEST(DecompTest, InvalidParametersThrow) {
    EXPECT_THROW(Decomposition(params(2,2,1,true),2),std::domain_error);
    EXPECT_THROW(Decomposition(params(0,0,0,true),0),std::domain_error);
    EXPECT_THROW(Decomposition(params(4,1,1,true,0.3),4),std::domain_error);
    EXPECT_THROW(Decomposition(params(1,1,1,true,-0.1),1),std::domain_error);
}

TEST(PartitionTest, OwnershipFollowsTheBound) {
    Decomposition decomp(params(2,1,1,true,0.1),2);
    Partition part(0,decomp);
    using R = Partition::coord_type;
    part.SetParticles({0,1,2,3},
                      {R(0.1,0.5,0.5), R(0.49,0.5,0.5), R(0.55,0.5,0.5), R(-0.05,0.5,0.5)},
                      {0.25,0.25,0.25,0.25});
    EXPECT_EQ(part.Local(),4);
    EXPECT_EQ(part.Inside(),2);
    EXPECT_TRUE(part.inside(0));
    EXPECT_FALSE(part.inside(2));
    EXPECT_EQ(part.shift(2),shift::index(1,0,0));
    EXPECT_EQ(part.shift(3),shift::index(-1,0,0));
    EXPECT_EQ(part.lookup(1),1);
    EXPECT_EQ(part.lookup(2),-1);
    EXPECT_EQ(part.chainID[0],Partition::NONE);
}

TEST(PartitionTest, RejectsBadParticleSets) {
    Decomposition decomp(params(1,1,1,true,0.1),1);
    Partition part(0,decomp);
    using R = Partition::coord_type;
    EXPECT_THROW(part.SetParticles({0,1},{R(0.1,0.1,0.1)},{1.0,1.0}),std::domain_error);
    EXPECT_THROW(part.SetParticles({5,5},{R(0.1,0.1,0.1),R(0.2,0.2,0.2)},{1.0,1.0}),std::domain_error);
}

TEST(PartitionTest, PaddingWiderThanDomainThrows) {
    Decomposition decomp(params(2,1,1,true,0.4),2);
    Bound narrow(Bound::coord_type(0.0,0.0,0.0),Bound::coord_type(0.2,1.0,1.0));
    EXPECT_THROW(Partition(0,decomp,narrow),std::domain_error);
    Bound empty(Bound::coord_type(0.5,0.0,0.0),Bound::coord_type(0.5,1.0,1.0));
    EXPECT_THROW(Partition(0,decomp,empty),std::domain_error);
}
