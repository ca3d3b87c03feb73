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

#ifndef SERVICE_BUILDCHAINS_H
#define SERVICE_BUILDCHAINS_H
#include <cstdint>
#include <algorithm>
#include "TraversePST.h"

struct ChainCounts {
    std::uint64_t nChains;      // global chain count
    std::uint64_t nPadded;      // chains that end in the padding
    std::uint64_t nAssigned;    // owned particles in a chain
    ChainCounts &operator+=(const ChainCounts &rhs) {
        nChains = std::max(nChains,rhs.nChains);
        nPadded += rhs.nPadded;
        nAssigned += rhs.nAssigned;
        return *this;
    }
};

struct BuildChainsInput {
    double dThreshold;
};

// Builds the local chains and moves them into the global id space.
class ServiceBuildChains : public TraversePartition<BuildChainsInput,ChainCounts> {
public:
    explicit ServiceBuildChains(PST pst)
        : TraversePartition(pst,PST_BUILDCHAINS,"BuildChains") {}
protected:
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) override;
};
#endif
