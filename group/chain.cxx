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

#include "chain.h"
#include <stdexcept>
#include "fmt/format.h"

namespace hopchain {

// Marks particles on the path being walked.
static constexpr std::int64_t PENDING = -2;

std::int64_t BuildChains(Partition &part, double dThreshold) {
    if (!(dThreshold > 0.0))
        throw std::domain_error(fmt::format("threshold must be positive (dThreshold={})",dThreshold));
    auto &chainID = part.chainID;
    std::int64_t nChains = 0;
    std::vector<std::int32_t> path;

    part.paddedTerminals.clear();
    for (auto pi=0; pi<part.Local(); ++pi) {
        if (chainID[pi] != Partition::NONE || !part.inside(pi) || part.density[pi] < dThreshold) continue;
        std::int64_t iChain;
        auto i = pi;
        path.clear();
        while (1) {
            path.push_back(i);
            chainID[i] = PENDING;
            auto nn = part.densestNN[i];
            if (chainID[nn] >= 0 && part.inside(i)) {
                iChain = chainID[nn];
                break;
            }
            // A link back onto the path can only come from a neighbour
            // list that does not start with the particle itself.
            else if (nn == i || !part.inside(i) || chainID[nn] == PENDING) {
                iChain = nChains++;
                if (!part.inside(i)) part.paddedTerminals.push_back(i);
                break;
            }
            i = nn;
        }
        for (auto j : path) chainID[j] = iChain;
    }
    part.nLocalChains = nChains;
    return nChains;
}

ChainOffsets AssignGlobalChainIDs(Partition &part, mdl::mdlBASE *mdl) {
    auto counts = mdl->Allgather<std::int64_t>(part.nLocalChains);
    ChainOffsets off {0,0};
    for (auto id=0; id<mdl->Threads(); ++id) {
        if (id < mdl->Self()) off.iOffset += counts[id];
        off.nGlobal += counts[id];
    }
    for (auto &c : part.chainID) {
        if (c >= 0) c += off.iOffset;
    }
    part.iChainOffset = off.iOffset;
    part.nGlobalChains = off.nGlobal;
    return off;
}

} // namespace hopchain
