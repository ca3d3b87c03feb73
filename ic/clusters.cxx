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

#include "clusters.h"
#include <cmath>
#include <memory>
#include <stdexcept>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>
#include "fmt/format.h"
#include "core/shift.h"

namespace hopchain {

ParticleSet GenerateClusters(const ClusterParameters &params, const Decomposition &decomp, int iDomain) {
    if (params.nParticles < 1)
        throw std::domain_error(fmt::format("nParticles must be positive (nParticles={})",params.nParticles));
    if (params.nClusters < 0 || params.dClusterFraction < 0.0 || params.dClusterFraction > 1.0)
        throw std::domain_error(fmt::format("invalid clusters: nClusters={} dClusterFraction={}",
                                            params.nClusters,params.dClusterFraction));
    std::unique_ptr<gsl_rng,decltype(&gsl_rng_free)> rng(gsl_rng_alloc(gsl_rng_mt19937),gsl_rng_free);
    gsl_rng_set(rng.get(),params.iSeed);

    const auto L = decomp.box();
    std::int64_t nInClusters = params.nClusters > 0 ? std::llround(params.dClusterFraction * params.nParticles) : 0;

    std::vector<Bound::coord_type> centers(params.nClusters);
    for (auto &c : centers) {
        for (auto d=0; d<3; ++d) c[d] = L * gsl_rng_uniform(rng.get());
    }

    std::vector<Bound::coord_type> r(params.nParticles);
    for (std::int64_t i=0; i<params.nParticles; ++i) {
        if (i < nInClusters) {
            const auto &c = centers[i % params.nClusters];
            for (auto d=0; d<3; ++d) {
                r[i][d] = c[d] + gsl_ran_gaussian(rng.get(),params.dClusterRadius);
                r[i][d] -= L * std::floor(r[i][d] / L);
                if (r[i][d] >= L) r[i][d] = 0.0;
            }
        }
        else {
            for (auto d=0; d<3; ++d) r[i][d] = L * gsl_rng_uniform(rng.get());
        }
    }
    return SelectDomain(r,1.0 / params.nParticles,decomp,iDomain);
}

ParticleSet SelectDomain(const std::vector<Bound::coord_type> &r, double m, const Decomposition &decomp, int iDomain) {
    const auto L = decomp.box();
    const auto pad = decomp.bound(iDomain).expand(decomp.padding());
    ParticleSet set;
    for (std::int64_t i=0; i<std::int64_t(r.size()); ++i) {
        // Keep the owned copy and any periodic image inside the padding
        for (auto iShift=0; iShift<shift::nShifts; ++iShift) {
            const auto &s = shift::table[iShift];
            if ((s[0] && !decomp.periodic(0)) || (s[1] && !decomp.periodic(1)) || (s[2] && !decomp.periodic(2))) continue;
            Bound::coord_type rr = r[i];
            for (auto d=0; d<3; ++d) rr[d] += s[d] * L;
            if (!pad.contains(rr)) continue;
            set.gidx.push_back(i);
            set.r.push_back(rr);
            set.m.push_back(m);
        }
    }
    return set;
}

} // namespace hopchain
