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

#include <cmath>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include <vector>
#include "smooth/kdtree.h"

using namespace hopchain;

namespace {

class KdTreeTest : public ::testing::Test {
protected:
    std::vector<KdTree::coord_type> r;
    std::vector<double> m;
    void SetUp() override {
        srand(1234);
        for (auto i=0; i<500; ++i) {
            r.push_back(KdTree::coord_type(get_rand(),get_rand(),get_rand()));
            m.push_back(1.0 / 500);
        }
    }
    double get_rand() {
        return (double)rand()/RAND_MAX;
    }
    double dist2(int i,int j) const {
        KdTree::coord_type dx = r[i] - r[j];
        return dx[0]*dx[0] + dx[1]*dx[1] + dx[2]*dx[2];
    }
    // Indices of the k nearest particles ordered by distance
    std::vector<int> brute(int i,int k) const {
        std::vector<int> idx(r.size());
        for (auto j=0u; j<r.size(); ++j) idx[j] = j;
        std::sort(idx.begin(),idx.end(),[&](int a,int b) {
            return dist2(i,a) < dist2(i,b) || (dist2(i,a) == dist2(i,b) && a < b);
        });
        idx.resize(k);
        return idx;
    }
};

TEST_F(KdTreeTest, NeighborsMatchBruteForce) {
    const int k = 16;
    KdTree tree(r,m,k);
    EXPECT_GT(tree.nodes(),1);
    std::vector<std::int32_t> list(k);
    for (auto i=0; i<int(r.size()); i+=7) {
        auto n = tree.neighbors(i,list.data());
        ASSERT_EQ(n,k);
        EXPECT_EQ(list[0],i);
        auto expected = brute(i,k);
        for (auto j=0; j<k; ++j) EXPECT_EQ(list[j],expected[j]) << "particle " << i << " neighbour " << j;
    }
}

TEST_F(KdTreeTest, DensityMatchesBruteForce) {
    const int k = 32;
    KdTree tree(r,m,k);
    for (auto i=0; i<int(r.size()); i+=11) {
        auto nn = brute(i,k);
        auto fBall2 = dist2(i,nn.back());
        auto ih2 = 4.0 / fBall2;
        double sum = 0.0;
        for (auto j : nn) {
            auto u = std::sqrt(dist2(i,j) * ih2);
            double w = 0.0;
            if (u < 1.0) w = 1.0 - 0.75*(2.0-u)*u*u;
            else if (u < 2.0) w = 0.25*(2.0-u)*(2.0-u)*(2.0-u);
            sum += w * m[j];
        }
        auto expected = M_1_PI * std::sqrt(ih2) * ih2 * sum;
        EXPECT_NEAR(tree.density(i),expected,1e-9*expected);
    }
}

TEST_F(KdTreeTest, RepeatedQueriesAgree) {
    const int k = 8;
    KdTree tree(r,m,k);
    std::vector<std::int32_t> a(k), b(k);
    auto rho = tree.density(42);
    tree.neighbors(42,a.data());
    tree.neighbors(3,b.data());
    tree.neighbors(42,b.data());
    EXPECT_EQ(a,b);
    EXPECT_DOUBLE_EQ(tree.density(42),rho);
}

TEST_F(KdTreeTest, TooFewParticlesThrows) {
    r.resize(4);
    m.resize(4);
    EXPECT_THROW(KdTree(r,m,8),std::domain_error);
    EXPECT_THROW(KdTree(r,m,0),std::domain_error);
}

} // namespace
