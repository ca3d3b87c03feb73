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

#include "partition.h"
#include <stdexcept>
#include "fmt/format.h"

namespace hopchain {

Partition::Partition(int iDomain, const Decomposition &decomp, const Bound &bnd)
    : iDomain(iDomain), decomp(decomp), bnd(bnd), nSmooth(0),
      nLocalChains(0), iChainOffset(0), nGlobalChains(0) {
    if (!bnd.valid())
        throw std::domain_error(fmt::format("domain {} has an empty or inverted bound",iDomain));
    if (decomp.padding() > bnd.minside())
        throw std::domain_error(fmt::format("padding {} is wider than domain {} (width {})",
                                            decomp.padding(),iDomain,bnd.minside()));
}

void Partition::SetParticles(std::vector<std::int64_t> g,
                             std::vector<coord_type> r,
                             std::vector<double> m) {
    if (g.size() != r.size() || g.size() != m.size())
        throw std::domain_error(fmt::format("particle arrays differ in length (gidx {}, position {}, mass {})",
                                            g.size(),r.size(),m.size()));
    gidx = std::move(g);
    position = std::move(r);
    mass = std::move(m);

    auto N = gidx.size();
    bInside.resize(N);
    insideIndex.clear();
    insideIndex.reserve(N);
    for (auto i=0u; i<N; ++i) {
        bInside[i] = bnd.contains(position[i]);
        if (bInside[i] && !insideIndex.emplace(gidx[i],i).second)
            throw std::domain_error(fmt::format("particle {} is owned twice by domain {}",gidx[i],iDomain));
    }
    density.assign(N,0.0);
    chainID.assign(N,NONE);
    densestNN.assign(N,-1);
    groupID.assign(N,NONE);
    nnList.clear();
    nnCount.assign(N,0);
    paddedTerminals.clear();
    nLocalChains = iChainOffset = nGlobalChains = 0;
    peaks.clear();
    edges.clear();
    reverseMap.clear();
    groupDensity.clear();
    groupMembers.clear();
    index.reset();
}

void Partition::SetIndex(std::unique_ptr<NeighborIndex> idx) {
    index = std::move(idx);
    nSmooth = index ? index->maxNeighbors() : 0;
    nnList.assign(std::size_t(Local())*nSmooth,-1);
    nnCount.assign(Local(),0);
}

} // namespace hopchain
