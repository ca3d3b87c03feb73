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

#include "exchange.h"
#include <algorithm>
#include <array>
#include <cassert>
#include <vector>
#include "core/shift.h"

namespace hopchain {

// Three messages per direction: count, records and replies.
static constexpr int TAG_EXCHANGE = 32;

std::int64_t ChainAlias::find(std::int64_t c) {
    auto it = parent.find(c);
    if (it == parent.end()) return c;
    auto root = find(it->second);
    it->second = root;
    return root;
}

void ChainAlias::join(std::int64_t a,std::int64_t b) {
    a = find(a);
    b = find(b);
    if (a == b) return;
    if (a < b) parent[b] = a;
    else       parent[a] = b;
}

ExchangeStats ExchangeRound(Partition &part, mdl::mdlBASE *mdl) {
    std::array<std::vector<LinkRecord>,shift::nShifts> bins;
    std::uint64_t nSent = 0, nDropped = 0, nChanged = 0;
    ChainAlias alias;

    for (auto i : part.paddedTerminals) {
        auto iShift = part.shift(i);
        assert(iShift != shift::iSelf);
        bins[iShift].push_back(LinkRecord{part.global(i),part.chainID[i]});
    }

    std::vector<LinkRecord> recv;
    std::vector<LinkReply> reply, answer;
    for (auto iShift=0; iShift<shift::nShifts; ++iShift) {
        if (iShift == shift::iSelf) continue;
        auto idTo = part.neighbor(iShift);
        auto idFrom = part.neighbor(shift::opposite(iShift));
        auto tag = TAG_EXCHANGE + 3*iShift;
        auto &send = bins[iShift];
        std::int64_t nSend = idTo < 0 ? 0 : send.size(), nRecv = 0;
        if (idTo < 0) nDropped += send.size();

        mdl->Sendrecv(&nSend,sizeof(nSend),idTo,&nRecv,idFrom<0 ? 0 : sizeof(nRecv),idFrom,tag);
        recv.resize(nRecv);
        mdl->Sendrecv(send.data(),nSend*sizeof(LinkRecord),idTo,
                      recv.data(),nRecv*sizeof(LinkRecord),idFrom,tag+1);
        nSent += nSend;

        reply.resize(nRecv);
        for (auto k=0; k<nRecv; ++k) {
            auto &rec = recv[k];
            reply[k] = LinkReply{rec.chainID,rec.chainID};
            auto li = part.lookup(rec.gidx);
            if (li < 0) {
                ++nDropped;
                continue;
            }
            auto c = part.chainID[li];
            if (c < 0 || rec.chainID < 0) continue;
            alias.join(c,rec.chainID);
            reply[k].joinID = std::min(c,rec.chainID);
        }
        answer.resize(nSend);
        mdl->Sendrecv(reply.data(),nRecv*sizeof(LinkReply),idFrom,
                      answer.data(),nSend*sizeof(LinkReply),idTo,tag+2);
        for (auto &a : answer) {
            if (a.sentID >= 0 && a.joinID >= 0) alias.join(a.sentID,a.joinID);
        }
    }

    if (!alias.empty()) {
        for (auto &c : part.chainID) {
            if (c < 0) continue;
            auto root = alias.find(c);
            if (root != c) {
                c = root;
                ++nChanged;
            }
        }
    }

    std::uint64_t local[3] = {nChanged,nSent,nDropped}, global[3];
    mdl->Allreduce(local,global,3,mdl::MDL_UINT64,mdl::MDL_SUM);
    return ExchangeStats{global[0],global[1],global[2]};
}

} // namespace hopchain
