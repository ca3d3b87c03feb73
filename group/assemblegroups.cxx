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

#include "assemblegroups.h"
#include "assemble.h"
#include "core/partition.h"

int ServiceAssembleGroups::Service(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto in = static_cast<input *>(vin);
    auto out = static_cast<output *>(vout);
    auto part = pst->plcl->part;
    assert(nIn == sizeof(input));

    hopchain::GroupAssembler assembler(part->peaks,in->dPeakThreshold,in->dSaddleThreshold);
    assembler.Merge(part->edges);
    out->nPurged = assembler.Purge(in->nMinMembers);
    out->nGroups = assembler.Groups();
    part->reverseMap = assembler.ReverseMap();

    part->groupDensity.assign(out->nGroups,0.0);
    part->groupMembers.assign(out->nGroups,0);
    for (auto c=0u; c<part->peaks.size(); ++c) {
        auto g = part->reverseMap[c];
        if (g < 0) continue;
        part->groupDensity[g] = std::max(part->groupDensity[g],part->peaks[c].fDensity);
        part->groupMembers[g] += part->peaks[c].nMembers;
    }
    for (auto i=0; i<part->Local(); ++i) {
        auto c = part->chainID[i];
        part->groupID[i] = c < 0 ? hopchain::Partition::NONE : part->reverseMap[c];
    }
    return sizeof(output);
}
