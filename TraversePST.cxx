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

#include "TraversePST.h"
#include <alloca.h>

int TraversePST::operator()(int nIn, void *pIn, void *pOut) {
    return Traverse(node_pst,pIn,nIn,pOut,getMaxBytesOut());
}

int TraversePST::Traverse(PST pst,void *vin,int nIn,void *vout,int nOut) {
    return pstAmCore(pst) ? Service(pst,vin,nIn,vout,nOut) : Recurse(pst,vin,nIn,vout,nOut);
}

// The reply of the upper half overwrites vout
int TraversePST::Recurse(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto rID = pst->mdl->ReqService(pst->idUpper,getServiceID(),vin,nIn);
    Traverse(pst->pstLower,vin,nIn,vout,nOut);
    return pst->mdl->GetReply(rID,vout);
}

int TraverseCombinePST::Recurse(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto rID = pst->mdl->ReqService(pst->idUpper,getServiceID(),vin,nIn);
    auto nLower = Traverse(pst->pstLower,vin,nIn,vout,nOut);
    if (nOut == 0) {
        pst->mdl->GetReply(rID);
        return nLower;
    }
    auto vUpper = alloca(nOut);
    auto nUpper = pst->mdl->GetReply(rID,vUpper);
    mdlassert(pst->mdl,nUpper == nLower);
    Combine(vout,vUpper);
    return nUpper;
}
