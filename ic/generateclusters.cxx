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

#include "generateclusters.h"
#include "core/partition.h"

int ServiceGenerateClusters::Service(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto in = static_cast<input *>(vin);
    auto out = static_cast<output *>(vout);
    auto part = pst->plcl->part;
    assert(nIn == sizeof(input));
    auto set = hopchain::GenerateClusters(*in,part->Decomp(),part->Domain());
    part->SetParticles(std::move(set.gidx),std::move(set.r),std::move(set.m));
    out->nLocal = part->Local();
    out->nInside = part->Inside();
    pst->mdl->mdl_printf("Domain %d: bound %g %g %g to %g %g %g\n",part->Domain(),
                         part->bound().lower(0),part->bound().lower(1),part->bound().lower(2),
                         part->bound().upper(0),part->bound().upper(1),part->bound().upper(2));
    return sizeof(output);
}
