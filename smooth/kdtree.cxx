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

#include "kdtree.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "fmt/format.h"

/* Standard M_4 Kernel */
#define KERNEL(ak,ar2) { \
        ak = 2.0 - sqrt(ar2); \
        if (ar2 < 1.0) ak = (1.0 - 0.75*ak*ar2); \
        else if (ar2 < 4.0) ak = 0.25*ak*ak*ak; \
        else ak = 0.0;\
        }

namespace hopchain {

KdTree::KdTree(const std::vector<coord_type> &r, const std::vector<double> &m, int nSmooth)
    : r(r), m(m), nSmooth(nSmooth), iLast(-1) {
    if (nSmooth < 1)
        throw std::domain_error(fmt::format("nSmooth must be at least 1 (nSmooth={})",nSmooth));
    if (r.size() < std::size_t(nSmooth))
        throw std::domain_error(fmt::format("{} particles cannot have {} neighbours",r.size(),nSmooth));
    BuildTree();
    pq.reserve(nSmooth);
}

static Bound tight_bound(const std::vector<KdTree::coord_type> &r, const std::int32_t *p, int n) {
    KdTree::coord_type lower = r[p[0]], upper = r[p[0]];
    for (auto i=1; i<n; ++i) {
        lower = blitz::min(lower,r[p[i]]);
        upper = blitz::max(upper,r[p[i]]);
    }
    return Bound(lower,upper);
}

// Split each cell at the median of its widest dimension until every
// bucket holds at most nBucket particles.
void KdTree::BuildTree() {
    int N = r.size();
    perm.resize(N);
    for (auto i=0; i<N; ++i) perm[i] = i;
    tree.clear();
    tree.reserve(2 * (N / nBucket + 1));
    tree.push_back(KDN{tight_bound(r,perm.data(),N),0,N,-1,-1});

    std::vector<std::int32_t> todo {0};
    while (!todo.empty()) {
        auto iCell = todo.back();
        todo.pop_back();
        auto pLower = tree[iCell].pLower, pUpper = tree[iCell].pUpper;
        if (pUpper - pLower <= nBucket) continue;
        auto d = tree[iCell].bnd.maxdim();
        auto pMid = (pLower + pUpper) / 2;
        std::nth_element(perm.begin()+pLower,perm.begin()+pMid,perm.begin()+pUpper,
                         [this,d](std::int32_t a,std::int32_t b) {return r[a][d] < r[b][d];});
        auto iLower = tree.size();
        tree.push_back(KDN{tight_bound(r,perm.data()+pLower,pMid-pLower),pLower,pMid,-1,-1});
        tree.push_back(KDN{tight_bound(r,perm.data()+pMid,pUpper-pMid),pMid,pUpper,-1,-1});
        tree[iCell].iLower = iLower;
        tree[iCell].iUpper = iLower + 1;
        todo.push_back(iLower);
        todo.push_back(iLower + 1);
    }
    // The search stack holds at most one entry per level.
    S.resize(static_cast<std::size_t>(std::log2(N+1)) + 64);
}

// Finds the nSmooth nearest particles to particle i. The queue is a
// max-heap on distance so the front is always the current search radius.
void KdTree::Search(int i) {
    if (i == iLast) return;
    const auto ri = r[i];
    pq.assign(nSmooth,PQ{std::numeric_limits<double>::infinity(),std::numeric_limits<std::int32_t>::max()});
    std::make_heap(pq.begin(),pq.end());

    int sp = 0;
    int iCell = 0;
    while (1) {
        while (tree[iCell].is_cell()) {
            auto iLower = tree[iCell].iLower, iUpper = tree[iCell].iUpper;
            auto min1 = tree[iLower].bnd.mindist(ri);
            auto min2 = tree[iUpper].bnd.mindist(ri);
            if (min1 < min2) {
                if (min1 > pq.front().fDist2) goto NoIntersect;
                S[sp].iCell = iUpper;
                S[sp].min = min2;
                ++sp;
                iCell = iLower;
            }
            else {
                if (min2 > pq.front().fDist2) goto NoIntersect;
                S[sp].iCell = iLower;
                S[sp].min = min1;
                ++sp;
                iCell = iUpper;
            }
        }
        /* Now at a bucket */
        for (auto pj = tree[iCell].pLower; pj < tree[iCell].pUpper; ++pj) {
            auto j = perm[pj];
            coord_type dr = ri - r[j];
            PQ q {blitz::dot(dr,dr),j};
            if (q < pq.front()) {
                std::pop_heap(pq.begin(),pq.end());
                pq.back() = q;
                std::push_heap(pq.begin(),pq.end());
            }
        }
NoIntersect:
        if (sp) {
            --sp;
            if (S[sp].min > pq.front().fDist2) goto NoIntersect;
            iCell = S[sp].iCell;
        }
        else break;
    }
    // Self first, then increasing distance.
    std::sort(pq.begin(),pq.end(),[i](const PQ &a,const PQ &b) {
        if ((a.iIndex==i) != (b.iIndex==i)) return a.iIndex==i;
        return a < b;
    });
    iLast = i;
}

double KdTree::density(int i) {
    double fBall2,ih2,r2,rs,fDensity;
    Search(i);
    fBall2 = 0.0;
    for (auto &q : pq) fBall2 = std::max(fBall2,q.fDist2);
    // Every neighbour sits on top of particle i
    if (fBall2 == 0.0) return std::numeric_limits<double>::infinity();
    ih2 = 4.0/fBall2;
    fDensity = 0.0;
    for (auto &q : pq) {
        r2 = q.fDist2*ih2;
        KERNEL(rs,r2);
        fDensity += rs*m[q.iIndex];
    }
    return M_1_PI*sqrt(ih2)*ih2*fDensity;
}

int KdTree::neighbors(int i, std::int32_t *list) {
    Search(i);
    for (auto j=0; j<nSmooth; ++j) list[j] = pq[j].iIndex;
    return nSmooth;
}

} // namespace hopchain
