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

#include "setadd.h"
#include <vector>

static_assert(std::is_trivial<ServiceSetAdd::input>());

// Runs outside TraversePST because it builds the tree that TraversePST walks.
int ServiceSetAdd::operator()(int nIn, void *pIn, void *pOut) {
    assert(nIn == sizeof(input));
    auto in = static_cast<input *>(pIn);
    SetAdd(node_pst,in->idLower,in->idUpper);
    return 0;
}

// Each pass hands [idMiddle,idUpper) to thread idMiddle and keeps the lower
// half in a new child node. Splits across processes land on a process edge.
void ServiceSetAdd::SetAdd(PST pst,int idLower,int idUpper) {
    auto mdl = pst->mdl;
    mdlassert(mdl,pst->nLeaves==1);
    mdlassert(mdl,idLower==mdl->Self());
    std::vector<int> pending;
    while (idUpper - idLower > 1) {
        int idMiddle = (idUpper + idLower) / 2;
        if (mdl->ThreadToProc(idLower) != mdl->ThreadToProc(idUpper-1))
            idMiddle = mdl->ProcToThread(mdl->ThreadToProc(idMiddle));
        pst->nLeaves = idUpper - idLower;
        pst->nLower = idMiddle - idLower;
        pst->nUpper = idUpper - idMiddle;
        pst->idUpper = idMiddle;
        input upper(idMiddle,idUpper);
        pending.push_back(mdl->ReqService(idMiddle,getServiceID(),&upper,sizeof(upper)));

        PST pstLower;
        pstInitialize(&pstLower,mdl,pst->plcl);
        pstLower->iLvl = pst->iLvl + 1;
        pst->pstLower = pstLower;
        pst = pstLower;
        idUpper = idMiddle;
    }
    // Innermost split finishes first
    for (auto it = pending.rbegin(); it != pending.rend(); ++it) mdl->GetReply(*it);
}
