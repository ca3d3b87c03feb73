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

#include "chaingraph.h"
#include "graph.h"

int ServiceChainGraph::Service(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto in = static_cast<input *>(vin);
    auto out = static_cast<output *>(vout);
    auto part = pst->plcl->part;
    assert(nIn == sizeof(input));
    part->peaks = hopchain::BuildPeakTable(*part,pst->mdl);
    auto local = hopchain::FindLocalEdges(*part,pst->mdl,in->nMerge);
    part->edges = hopchain::MergeEdges(local,part->peaks,pst->mdl);
    part->ReleaseIndex();

    out->nChains = std::count_if(part->peaks.begin(),part->peaks.end(),
                                 [](const hopchain::ChainPeak &p) {return p.nMembers > 0;});
    out->nEdges = part->edges.size();
    pst->mdl->mdl_printf("Domain %d: %zu local edges\n",part->Domain(),local.size());
    return sizeof(output);
}
