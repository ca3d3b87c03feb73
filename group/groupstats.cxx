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

#include "groupstats.h"
#include "core/partition.h"

int ServiceGroupStats::Service(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto out = static_cast<output *>(vout);
    auto part = pst->plcl->part;
    out->nGrouped = out->nUngrouped = 0;
    for (auto i=0; i<part->Local(); ++i) {
        if (!part->inside(i)) continue;
        if (part->groupID[i] >= 0) ++out->nGrouped;
        else ++out->nUngrouped;
    }
    return sizeof(output);
}
