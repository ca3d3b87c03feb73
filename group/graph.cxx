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

#include "graph.h"
#include <algorithm>
#include <array>
#include <map>
#include <utility>
#include "core/shift.h"

namespace hopchain {

// Two messages per direction: request count with gidx list, and answers.
static constexpr int TAG_GRAPH = 128;

struct GhostRequest {
    std::int64_t gidx;
};
struct GhostAnswer {
    std::int64_t chainID;
    double fDensity;
};

std::vector<ChainPeak> BuildPeakTable(const Partition &part, mdl::mdlBASE *mdl) {
    std::map<std::int64_t,ChainPeak> local;
    for (auto i=0; i<part.Local(); ++i) {
        auto c = part.chainID[i];
        if (c < 0 || !part.inside(i)) continue;
        auto it = local.emplace(c,ChainPeak{c,part.global(i),0,part.density[i]}).first;
        auto &p = it->second;
        ++p.nMembers;
        if (part.density[i] > p.fDensity || (part.density[i] == p.fDensity && part.global(i) < p.iGlobal)) {
            p.fDensity = part.density[i];
            p.iGlobal = part.global(i);
        }
    }
    std::vector<ChainPeak> mine;
    mine.reserve(local.size());
    for (auto &kv : local) mine.push_back(kv.second);

    auto all = mdl->Allgatherv(mine);
    std::vector<ChainPeak> peaks(part.nGlobalChains);
    for (auto c=0; c<part.nGlobalChains; ++c) peaks[c] = ChainPeak{c,-1,0,-1.0};
    for (auto &q : all) {
        auto &p = peaks[q.iChain];
        if (q.fDensity > p.fDensity || (q.fDensity == p.fDensity && q.iGlobal < p.iGlobal)) {
            p.fDensity = q.fDensity;
            p.iGlobal = q.iGlobal;
        }
        p.nMembers += q.nMembers;
    }
    return peaks;
}

static void keep_densest(std::map<std::pair<std::int64_t,std::int64_t>,double> &edges,
                         std::int64_t a, std::int64_t b, double fDensity) {
    auto key = std::make_pair(std::min(a,b),std::max(a,b));
    auto it = edges.find(key);
    if (it == edges.end()) edges.emplace(key,fDensity);
    else if (fDensity > it->second) it->second = fDensity;
}

std::vector<ChainEdge> FindLocalEdges(const Partition &part, mdl::mdlBASE *mdl, int nMerge) {
    std::map<std::pair<std::int64_t,std::int64_t>,double> edges;
    // (chain, ghost local index) -> densest local endpoint
    std::map<std::pair<std::int64_t,std::int32_t>,double> potential;

    for (auto i=0; i<part.Local(); ++i) {
        auto c = part.chainID[i];
        if (c < 0 || !part.inside(i)) continue;
        auto nn = part.neighbors(i);
        auto n = std::min(nMerge+2,part.neighborCount(i));
        for (auto k=0; k<n; ++k) {
            auto j = nn[k];
            if (j == i || j == part.densestNN[i]) continue;
            auto cj = part.chainID[j];
            if (cj == c) continue;
            if (cj >= 0) keep_densest(edges,c,cj,0.5*(part.density[i] + part.density[j]));
            else if (!part.inside(j)) {
                auto key = std::make_pair(c,j);
                auto it = potential.find(key);
                if (it == potential.end()) potential.emplace(key,part.density[i]);
                else it->second = std::max(it->second,part.density[i]);
            }
        }
    }

    // Ask the owner of each unassigned ghost for its chain and density
    std::array<std::vector<std::pair<std::int64_t,std::int32_t>>,shift::nShifts> asked;
    for (auto &kv : potential) asked[part.shift(kv.first.second)].push_back(kv.first);

    std::vector<GhostRequest> send, recv;
    std::vector<GhostAnswer> reply, answer;
    for (auto iShift=0; iShift<shift::nShifts; ++iShift) {
        if (iShift == shift::iSelf) continue;
        auto idTo = part.neighbor(iShift);
        auto idFrom = part.neighbor(shift::opposite(iShift));
        auto tag = TAG_GRAPH + 3*iShift;
        send.clear();
        if (idTo >= 0) for (auto &a : asked[iShift]) send.push_back(GhostRequest{part.global(a.second)});
        std::int64_t nSend = send.size(), nRecv = 0;

        mdl->Sendrecv(&nSend,sizeof(nSend),idTo,&nRecv,idFrom<0 ? 0 : sizeof(nRecv),idFrom,tag);
        recv.resize(nRecv);
        mdl->Sendrecv(send.data(),nSend*sizeof(GhostRequest),idTo,
                      recv.data(),nRecv*sizeof(GhostRequest),idFrom,tag+1);
        reply.resize(nRecv);
        for (auto k=0; k<nRecv; ++k) {
            auto li = part.lookup(recv[k].gidx);
            if (li < 0) reply[k] = GhostAnswer{Partition::NONE,0.0};
            else reply[k] = GhostAnswer{part.chainID[li],part.density[li]};
        }
        answer.resize(nSend);
        mdl->Sendrecv(reply.data(),nRecv*sizeof(GhostAnswer),idFrom,
                      answer.data(),nSend*sizeof(GhostAnswer),idTo,tag+2);
        for (auto k=0; k<nSend; ++k) {
            auto &key = asked[iShift][k];
            auto cj = answer[k].chainID;
            if (cj < 0 || cj == key.first) continue;
            keep_densest(edges,key.first,cj,0.5*(potential[key] + answer[k].fDensity));
        }
    }

    std::vector<ChainEdge> out;
    out.reserve(edges.size());
    for (auto &kv : edges) out.push_back(ChainEdge{kv.first.first,kv.first.second,kv.second});
    return out;
}

std::vector<ChainEdge> MergeEdges(const std::vector<ChainEdge> &local,
                                  const std::vector<ChainPeak> &peaks, mdl::mdlBASE *mdl) {
    std::map<std::pair<std::int64_t,std::int64_t>,double> merged;
    for (auto &e : mdl->Allgatherv(local)) keep_densest(merged,e.iHigh,e.iLow,e.fDensity);

    std::vector<ChainEdge> edges;
    edges.reserve(merged.size());
    for (auto &kv : merged) {
        auto a = kv.first.first, b = kv.first.second;
        if (denser_peak(peaks,a,b)) edges.push_back(ChainEdge{a,b,kv.second});
        else                        edges.push_back(ChainEdge{b,a,kv.second});
    }
    return edges;
}

} // namespace hopchain
