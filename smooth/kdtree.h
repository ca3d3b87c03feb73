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

#ifndef SMOOTH_KDTREE_H
#define SMOOTH_KDTREE_H
#include <cstdint>
#include <vector>
#include "core/bound.h"
#include "neighbors.h"

namespace hopchain {

/*
** A kd-tree over a fixed set of positions answering k nearest neighbour
** queries. Ghost particles are stored at their image positions so the
** search never needs to wrap. Density is the M4 kernel estimate over the
** k nearest neighbours.
*/
class KdTree : public NeighborIndex {
public:
    using coord_type = Bound::coord_type;
    static constexpr int nBucket = 8;
protected:
    struct KDN {
        Bound bnd;
        std::int32_t pLower, pUpper;  // range [pLower,pUpper) of perm
        std::int32_t iLower, iUpper;  // children, or -1 for a bucket
        bool is_cell() const {return iLower >= 0;}
    };
    struct PQ {
        double fDist2;
        std::int32_t iIndex;
        bool operator<(const PQ &rhs) const {
            return fDist2 < rhs.fDist2 || (fDist2 == rhs.fDist2 && iIndex < rhs.iIndex);
        }
    };
    struct stStack {
        std::int32_t iCell;
        double min;
    };

    const std::vector<coord_type> &r;
    const std::vector<double> &m;
    int nSmooth;
    std::vector<std::int32_t> perm;
    std::vector<KDN> tree;
    std::vector<PQ> pq;
    std::vector<stStack> S;
    int iLast;

    void BuildTree();
    void Search(int i);
public:
    KdTree(const std::vector<coord_type> &r, const std::vector<double> &m, int nSmooth);
    virtual int maxNeighbors() const override {return nSmooth;}
    virtual double density(int i) override;
    virtual int neighbors(int i, std::int32_t *list) override;
    int nodes() const {return tree.size();}
};

} // namespace hopchain

#endif
