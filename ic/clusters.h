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

#ifndef IC_CLUSTERS_H
#define IC_CLUSTERS_H
#include <cstdint>
#include <vector>
#include "core/decomp.h"

namespace hopchain {

struct ClusterParameters {
    std::int64_t nParticles;
    int nClusters;
    double dClusterFraction;   // share of the particles placed in clusters
    double dClusterRadius;     // Gaussian sigma of each cluster
    std::uint64_t iSeed;
};

struct ParticleSet {
    std::vector<std::int64_t> gidx;
    std::vector<Bound::coord_type> r;
    std::vector<double> m;
};

/*
** Draws a catalogue of Gaussian clusters over a uniform background and
** keeps the particles of one domain together with every image that falls
** in its padding. The catalogue depends only on the parameters, so every
** domain sees the same particles. Each particle has mass 1/nParticles.
*/
ParticleSet GenerateClusters(const ClusterParameters &params, const Decomposition &decomp, int iDomain);

// The particles of a global catalogue that domain iDomain holds: those it
// owns and the periodic images of any particle within its padding. The
// catalogue index becomes the global id.
ParticleSet SelectDomain(const std::vector<Bound::coord_type> &r, double m, const Decomposition &decomp, int iDomain);

} // namespace hopchain

#endif
