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

#include "assemble.h"
#include <algorithm>

namespace hopchain {

GroupAssembler::GroupAssembler(const std::vector<ChainPeak> &peaks, double dPeakThreshold, double dSaddleThreshold)
    : peaks(peaks), dPeakThreshold(dPeakThreshold), dSaddleThreshold(dSaddleThreshold),
      parent(peaks.size()), attach(peaks.size(),-1), densestBound(peaks.size(),-1.0),
      reverseMap(peaks.size(),-1), nGroups(0) {
    for (auto c=0u; c<peaks.size(); ++c) parent[c] = c;
}

std::int64_t GroupAssembler::find(std::int64_t c) {
    auto r = c;
    while (parent[r] != r) r = parent[r];
    while (parent[c] != r) {
        auto next = parent[c];
        parent[c] = r;
        c = next;
    }
    return r;
}

// The root with the denser peak survives; equal peaks keep the lower id.
void GroupAssembler::unite(std::int64_t high, std::int64_t low) {
    auto a = find(high), b = find(low);
    if (a == b) return;
    auto &pa = peaks[a], &pb = peaks[b];
    if (pb.fDensity > pa.fDensity || (pb.fDensity == pa.fDensity && b < a)) std::swap(a,b);
    parent[b] = a;
}

void GroupAssembler::Merge(const std::vector<ChainEdge> &edges) {
    fringe.clear();
    for (auto &e : edges) {
        auto bHigh = is_peak(e.iHigh), bLow = is_peak(e.iLow);
        if (bHigh && bLow) {
            if (e.fDensity >= dSaddleThreshold) unite(e.iHigh,e.iLow);
        }
        else if (bHigh || bLow) {
            auto high = bHigh ? e.iHigh : e.iLow;
            auto low  = bHigh ? e.iLow : e.iHigh;
            if (e.fDensity > densestBound[low]) {
                densestBound[low] = e.fDensity;
                attach[low] = high;
            }
        }
        else fringe.push_back(e);
    }

    for (auto c=0u; c<peaks.size(); ++c) {
        if (is_peak(c)) reverseMap[c] = find(c);
        else if (attach[c] >= 0) reverseMap[c] = find(attach[c]);
    }

    // Spread groups along fringe boundaries. A chain is only as well
    // connected as the weakest boundary on its way to a seeded chain.
    bool bChanged = true;
    while (bChanged) {
        bChanged = false;
        for (auto &e : fringe) {
            auto &dbLow = densestBound[e.iLow];
            auto dbHigh = densestBound[e.iHigh];
            if (e.fDensity > dbLow && dbHigh > dbLow) {
                dbLow = std::min(e.fDensity,dbHigh);
                reverseMap[e.iLow] = reverseMap[e.iHigh];
                bChanged = true;
            }
        }
    }
    nGroups = Compact(reverseMap);
}

std::int64_t GroupAssembler::Compact(std::vector<std::int64_t> &map) {
    std::vector<std::int64_t> ids;
    for (auto g : map) if (g >= 0) ids.push_back(g);
    std::sort(ids.begin(),ids.end());
    ids.erase(std::unique(ids.begin(),ids.end()),ids.end());
    for (auto &g : map) {
        if (g >= 0) g = std::lower_bound(ids.begin(),ids.end(),g) - ids.begin();
    }
    return ids.size();
}

// Drop groups with fewer than nMinMembers particles and renumber.
std::int64_t GroupAssembler::Purge(std::int64_t nMinMembers) {
    if (nMinMembers <= 0) return 0;
    std::vector<std::int64_t> members(nGroups,0);
    for (auto c=0u; c<peaks.size(); ++c) {
        if (reverseMap[c] >= 0) members[reverseMap[c]] += peaks[c].nMembers;
    }
    std::int64_t nPurged = 0;
    for (auto g=0; g<nGroups; ++g) if (members[g] < nMinMembers) ++nPurged;
    if (nPurged == 0) return 0;
    for (auto &g : reverseMap) {
        if (g >= 0 && members[g] < nMinMembers) g = -1;
    }
    nGroups = Compact(reverseMap);
    return nPurged;
}

} // namespace hopchain
