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

#ifndef GROUP_CHAINTYPES_H
#define GROUP_CHAINTYPES_H
#include <cstdint>

namespace hopchain {

// One entry of the global peak table. Chains that lost all their members
// to a lower alias keep nMembers == 0 and fDensity < 0.
struct ChainPeak {
    std::int64_t iChain;
    std::int64_t iGlobal;   // global index of the densest member
    std::int64_t nMembers;
    double fDensity;
};

// An edge of the chain graph; iHigh has the denser peak.
struct ChainEdge {
    std::int64_t iHigh;
    std::int64_t iLow;
    double fDensity;        // densest boundary seen between the two chains
};

// Sent across a partition boundary: a particle and the chain it belongs to
struct LinkRecord {
    std::int64_t gidx;
    std::int64_t chainID;
};

// Answer to a LinkRecord: the chain id that was sent and the id it joins
struct LinkReply {
    std::int64_t sentID;
    std::int64_t joinID;
};

} // namespace hopchain

#endif
