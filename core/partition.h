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

#ifndef CORE_PARTITION_H
#define CORE_PARTITION_H
#include <cstdint>
#include <memory>
#include <vector>
#include <unordered_map>
#include "bound.h"
#include "decomp.h"
#include "smooth/neighbors.h"
#include "group/chaintypes.h"

namespace hopchain {

/*
** The particles held by one worker: the owned ("inside") particles of its
** domain followed or interleaved by ghost copies from the padding around
** it. Each attribute is its own array indexed by the local particle index.
*/
class Partition {
public:
    using coord_type = Bound::coord_type;
    static constexpr std::int64_t NONE = -1;

protected:
    int iDomain;
    Decomposition decomp;
    Bound bnd;

    std::vector<std::int64_t> gidx;
    std::vector<coord_type>   position;
    std::vector<double>       mass;
    std::vector<std::uint8_t> bInside;
    std::unordered_map<std::int64_t,std::int32_t> insideIndex;

    std::unique_ptr<NeighborIndex> index;
    int nSmooth;

public:
    std::vector<double>       density;
    std::vector<std::int64_t> chainID;
    std::vector<std::int32_t> densestNN;
    std::vector<std::int32_t> nnList;  // nSmooth entries per particle, -1 padded
    std::vector<std::int32_t> nnCount;
    std::vector<std::int32_t> paddedTerminals;
    std::vector<std::int64_t> groupID;

    std::int64_t nLocalChains;
    std::int64_t iChainOffset;
    std::int64_t nGlobalChains;

    // Global tables, identical on every worker once built
    std::vector<ChainPeak>    peaks;
    std::vector<ChainEdge>    edges;
    std::vector<std::int64_t> reverseMap;
    std::vector<double>       groupDensity;
    std::vector<std::int64_t> groupMembers;

public:
    Partition(int iDomain, const Decomposition &decomp, const Bound &bnd);
    Partition(int iDomain, const Decomposition &decomp)
        : Partition(iDomain,decomp,decomp.bound(iDomain)) {}

    void SetParticles(std::vector<std::int64_t> gidx,
                      std::vector<coord_type> position,
                      std::vector<double> mass);

    int Domain() const {return iDomain;}
    const Decomposition &Decomp() const {return decomp;}
    const Bound &bound() const {return bnd;}
    std::int32_t Local() const {return gidx.size();}
    std::int32_t Inside() const {return insideIndex.size();}

    std::int64_t global(int i) const {return gidx[i];}
    const coord_type &r(int i) const {return position[i];}
    const std::vector<coord_type> &positions() const {return position;}
    const std::vector<double> &masses() const {return mass;}
    double m(int i) const {return mass[i];}
    bool inside(int i) const {return bInside[i] != 0;}
    int shift(int i) const {return bnd.shift(position[i]);}
    int neighbor(int iShift) const {return decomp.neighbor(iDomain,iShift);}

    // Local index of the owned copy of a global particle, or -1.
    std::int32_t lookup(std::int64_t g) const {
        auto it = insideIndex.find(g);
        return it == insideIndex.end() ? -1 : it->second;
    }

    const std::int32_t *neighbors(int i) const {return nnList.data() + std::size_t(i)*nSmooth;}
    int neighborCount(int i) const {return nnCount[i];}
    int Smooth() const {return nSmooth;}

    void SetIndex(std::unique_ptr<NeighborIndex> idx);
    NeighborIndex *Index() const {return index.get();}
    void ReleaseIndex() {index.reset();}
};

} // namespace hopchain

#endif
