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

#ifndef SERVICE_CHAINGRAPH_H
#define SERVICE_CHAINGRAPH_H
#include <cstdint>
#include <algorithm>
#include "TraversePST.h"

struct GraphCounts {
    std::uint64_t nChains;   // chains that still own particles
    std::uint64_t nEdges;
    GraphCounts &operator+=(const GraphCounts &rhs) {
        nChains = std::max(nChains,rhs.nChains);
        nEdges = std::max(nEdges,rhs.nEdges);
        return *this;
    }
};

struct ChainGraphInput {
    int nMerge;
};

// Builds the global peak table and chain graph on every worker and then
// releases the neighbour index.
class ServiceChainGraph : public TraversePartition<ChainGraphInput,GraphCounts> {
public:
    explicit ServiceChainGraph(PST pst)
        : TraversePartition(pst,PST_CHAINGRAPH,"ChainGraph") {}
protected:
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) override;
};
#endif
