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

#include "decomp.h"
#include <cmath>
#include <stdexcept>
#include <algorithm>
#include <vector>
#include "fmt/format.h"

namespace hopchain {

// Spread the prime factors of nDomains over three axes, largest first,
// always onto the axis with the fewest domains so far.
std::array<int,3> Decomposition::factorise(int nDomains) {
    std::array<int,3> n = {1,1,1};
    std::vector<int> factors;
    for (auto p=2; p*p<=nDomains; ++p) {
        while (nDomains % p == 0) {
            factors.push_back(p);
            nDomains /= p;
        }
    }
    if (nDomains > 1) factors.push_back(nDomains);
    std::sort(factors.rbegin(),factors.rend());
    for (auto f : factors) {
        auto d = std::min_element(n.begin(),n.end()) - n.begin();
        n[d] *= f;
    }
    return n;
}

Decomposition::Decomposition(const DecompParameters &params, int nDomains)
    : dBoxSize(params.dBoxSize), dPadding(params.dPadding) {
    if (nDomains < 1)
        throw std::domain_error(fmt::format("invalid number of domains {}",nDomains));
    if (!(dBoxSize > 0.0))
        throw std::domain_error(fmt::format("box size must be positive (dBoxSize={})",dBoxSize));
    if (params.nGrid[0]==0 && params.nGrid[1]==0 && params.nGrid[2]==0) nGrid = factorise(nDomains);
    else {
        for (auto d=0; d<3; ++d) nGrid[d] = params.nGrid[d];
        if (nGrid[0]<1 || nGrid[1]<1 || nGrid[2]<1 || domains() != nDomains)
            throw std::domain_error(fmt::format("nDomains {}x{}x{} does not match {} threads",
                                                nGrid[0],nGrid[1],nGrid[2],nDomains));
    }
    for (auto d=0; d<3; ++d) bPeriodic[d] = params.bPeriodic[d] != 0;
    if (dPadding < 0.0)
        throw std::domain_error(fmt::format("padding must not be negative (dPadding={})",dPadding));
    for (auto d=0; d<3; ++d) {
        if (dPadding > dBoxSize / nGrid[d])
            throw std::domain_error(fmt::format("padding {} is wider than a domain ({})",
                                                dPadding,dBoxSize / nGrid[d]));
    }
}

std::array<int,3> Decomposition::coords(int iDomain) const {
    return {iDomain / (nGrid[1]*nGrid[2]), (iDomain / nGrid[2]) % nGrid[1], iDomain % nGrid[2]};
}

int Decomposition::id(const std::array<int,3> &c) const {
    return (c[0]*nGrid[1] + c[1])*nGrid[2] + c[2];
}

Bound Decomposition::bound(int iDomain) const {
    auto c = coords(iDomain);
    Bound::coord_type lower, upper;
    for (auto d=0; d<3; ++d) {
        lower[d] = dBoxSize * c[d] / nGrid[d];
        upper[d] = (c[d]+1 == nGrid[d]) ? dBoxSize : dBoxSize * (c[d]+1) / nGrid[d];
    }
    return Bound(lower,upper);
}

// Returns -1 when the step leaves a non-periodic box.
int Decomposition::neighbor(int iDomain, int iShift) const {
    auto c = coords(iDomain);
    const auto &s = shift::table[iShift];
    for (auto d=0; d<3; ++d) {
        c[d] += s[d];
        if (c[d] < 0 || c[d] >= nGrid[d]) {
            if (!bPeriodic[d]) return -1;
            c[d] = (c[d] + nGrid[d]) % nGrid[d];
        }
    }
    return id(c);
}

int Decomposition::owner(Bound::coord_type r) const {
    std::array<int,3> c;
    for (auto d=0; d<3; ++d) {
        auto x = r[d];
        if (bPeriodic[d]) x -= dBoxSize * std::floor(x / dBoxSize);
        c[d] = std::clamp(static_cast<int>(std::floor(x * nGrid[d] / dBoxSize)),0,nGrid[d]-1);
    }
    return id(c);
}

} // namespace hopchain
