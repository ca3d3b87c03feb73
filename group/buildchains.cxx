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

#include "buildchains.h"
#include "chain.h"

int ServiceBuildChains::Service(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto in = static_cast<input *>(vin);
    auto out = static_cast<output *>(vout);
    auto part = pst->plcl->part;
    assert(nIn == sizeof(input));
    auto nLocal = hopchain::BuildChains(*part,in->dThreshold);
    auto off = hopchain::AssignGlobalChainIDs(*part,pst->mdl);
    out->nChains = off.nGlobal;
    out->nPadded = part->paddedTerminals.size();
    out->nAssigned = 0;
    for (auto i=0; i<part->Local(); ++i) {
        if (part->inside(i) && part->chainID[i] >= 0) ++out->nAssigned;
    }
    pst->mdl->mdl_printf("Domain %d: %lld chains from %lld, %zu padded\n",part->Domain(),
                         static_cast<long long>(nLocal),static_cast<long long>(off.iOffset),
                         part->paddedTerminals.size());
    return sizeof(output);
}
