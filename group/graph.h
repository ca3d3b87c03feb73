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

#ifndef GROUP_GRAPH_H
#define GROUP_GRAPH_H
#include <cstdint>
#include <vector>
#include "core/partition.h"
#include "mdlbase.h"

namespace hopchain {

/// @brief Densest inside member of every chain, merged over all workers
/// @return table indexed by global chain id
std::vector<ChainPeak> BuildPeakTable(const Partition &part, mdl::mdlBASE *mdl);

/// @brief Boundary densities between adjacent chains of this partition
/// Unassigned ghosts are resolved by asking the worker that owns them.
/// @param nMerge the first nMerge+2 neighbours of each particle are examined
/// @return unordered pairs (iHigh < iLow by id) with the densest boundary
std::vector<ChainEdge> FindLocalEdges(const Partition &part, mdl::mdlBASE *mdl, int nMerge);

/// @brief Gather, max-merge and orient the edges of all workers
std::vector<ChainEdge> MergeEdges(const std::vector<ChainEdge> &local,
                                  const std::vector<ChainPeak> &peaks, mdl::mdlBASE *mdl);

// Orders a pair of chains by peak density; equal peaks put the lower id first.
inline bool denser_peak(const std::vector<ChainPeak> &peaks, std::int64_t a, std::int64_t b) {
    return peaks[a].fDensity > peaks[b].fDensity || (peaks[a].fDensity == peaks[b].fDensity && a < b);
}

} // namespace hopchain

#endif
