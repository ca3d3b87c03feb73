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

#include "density.h"
#include "kdtree.h"
#include <limits>
#include <stdexcept>
#include "fmt/format.h"

namespace hopchain {

void BuildNeighborIndex(Partition &part, int nSmooth) {
    if (nSmooth < 1)
        throw std::domain_error(fmt::format("nSmooth must be at least 1 (nSmooth={})",nSmooth));
    if (part.Local() < nSmooth)
        throw std::domain_error(fmt::format("domain {} has {} particles, fewer than nSmooth={}",
                                            part.Domain(),part.Local(),nSmooth));
    part.SetIndex(std::make_unique<KdTree>(part.positions(),part.masses(),nSmooth));
}

void ComputeDensity(Partition &part) {
    auto index = part.Index();
    if (index == nullptr)
        throw std::logic_error("density requested without a neighbour index");
    auto N = part.Local();
    auto k = part.Smooth();
    for (auto i=0; i<N; ++i) {
        part.density[i] = index->density(i);
        part.nnCount[i] = index->neighbors(i,part.nnList.data() + std::size_t(i)*k);
    }
    // The densest entry of the list, self included; the first maximum wins.
    for (auto i=0; i<N; ++i) {
        auto nn = part.neighbors(i);
        auto iMax = i;
        auto fMax = -std::numeric_limits<double>::infinity();
        for (auto j=0; j<part.neighborCount(i); ++j) {
            if (part.density[nn[j]] > fMax) {
                fMax = part.density[nn[j]];
                iMax = nn[j];
            }
        }
        part.densestNN[i] = iMax;
    }
}

} // namespace hopchain
