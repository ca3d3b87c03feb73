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

#ifndef GROUP_ASSEMBLE_H
#define GROUP_ASSEMBLE_H
#include <cstdint>
#include <vector>
#include "chaintypes.h"

namespace hopchain {

/*
** Merges chains into groups. Every worker runs this on the same global
** peak table and edge list and so arrives at the same reverse map.
**
** Chains with a peak at or above dPeakThreshold seed groups. Two seeded
** chains join when their boundary reaches dSaddleThreshold. A chain below
** the peak threshold attaches to the seeded neighbour it shares the
** densest boundary with, and from there groups spread to the remaining
** chains through their densest boundaries.
*/
class GroupAssembler {
protected:
    const std::vector<ChainPeak> &peaks;
    double dPeakThreshold;
    double dSaddleThreshold;
    std::vector<std::int64_t> parent;     // disjoint set forest over seeded chains
    std::vector<std::int64_t> attach;     // seeded chain a fringe chain hangs off, or -1
    std::vector<double> densestBound;
    std::vector<ChainEdge> fringe;
    std::vector<std::int64_t> reverseMap;
    std::int64_t nGroups;

    std::int64_t find(std::int64_t c);
    void unite(std::int64_t high, std::int64_t low);
    bool is_peak(std::int64_t c) const {return peaks[c].fDensity >= dPeakThreshold;}
public:
    GroupAssembler(const std::vector<ChainPeak> &peaks, double dPeakThreshold, double dSaddleThreshold);

    void Merge(const std::vector<ChainEdge> &edges);
    std::int64_t Purge(std::int64_t nMinMembers);

    std::int64_t Groups() const {return nGroups;}
    const std::vector<std::int64_t> &ReverseMap() const {return reverseMap;}
    const std::vector<double> &DensestBound() const {return densestBound;}

    /// @brief Renumber the group ids of a map to 0..n-1 in increasing order
    /// Entries of -1 are left alone. Applying it twice changes nothing.
    /// @return number of distinct groups
    static std::int64_t Compact(std::vector<std::int64_t> &map);
};

} // namespace hopchain

#endif
