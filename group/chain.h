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

#ifndef GROUP_CHAIN_H
#define GROUP_CHAIN_H
#include <cstdint>
#include "core/partition.h"
#include "mdlbase.h"

namespace hopchain {

/// @brief Link particles into chains by steepest density ascent
/// @param part partition with densities and densestNN filled in
/// @param dThreshold particles below this density are never linked
/// @return number of chains created, numbered 0..n-1 locally
std::int64_t BuildChains(Partition &part, double dThreshold);

struct ChainOffsets {
    std::int64_t iOffset;   // first global id of this worker's chains
    std::int64_t nGlobal;   // chains over all workers
};

/// @brief Move local chain ids into a global id space
/// Worker w receives the ids following those of workers 0..w-1.
ChainOffsets AssignGlobalChainIDs(Partition &part, mdl::mdlBASE *mdl);

} // namespace hopchain

#endif
