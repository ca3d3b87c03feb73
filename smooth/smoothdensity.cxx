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

#include "smoothdensity.h"
#include "density.h"
#include <stdexcept>
#include "fmt/format.h"

int ServiceDensity::Service(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto in = static_cast<input *>(vin);
    auto out = static_cast<output *>(vout);
    auto part = pst->plcl->part;
    assert(nIn == sizeof(input));
    if (in->nMerge < 0 || in->nMerge + 2 > in->nSmooth)
        throw std::domain_error(fmt::format("nMerge+2 ({}) exceeds nSmooth ({})",in->nMerge+2,in->nSmooth));
    hopchain::BuildNeighborIndex(*part,in->nSmooth);
    hopchain::ComputeDensity(*part);

    out->nInside = out->nAbove = out->nPeaks = 0;
    out->dMaxDensity = 0.0;
    for (auto i=0; i<part->Local(); ++i) {
        if (!part->inside(i)) continue;
        ++out->nInside;
        if (part->density[i] >= in->dThreshold) ++out->nAbove;
        if (part->densestNN[i] == i) ++out->nPeaks;
        out->dMaxDensity = std::max(out->dMaxDensity,part->density[i]);
    }
    pst->mdl->mdl_printf("Domain %d: %d local, %d inside, %llu above threshold\n",
                         part->Domain(),part->Local(),part->Inside(),
                         static_cast<unsigned long long>(out->nAbove));
    return sizeof(output);
}
