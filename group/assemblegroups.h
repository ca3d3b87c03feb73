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

#ifndef SERVICE_ASSEMBLEGROUPS_H
#define SERVICE_ASSEMBLEGROUPS_H
#include <cstdint>
#include <algorithm>
#include "TraversePST.h"

struct GroupCounts {
    std::uint64_t nGroups;
    std::uint64_t nPurged;    // groups dropped for having too few members
    GroupCounts &operator+=(const GroupCounts &rhs) {
        nGroups = std::max(nGroups,rhs.nGroups);
        nPurged = std::max(nPurged,rhs.nPurged);
        return *this;
    }
};

struct AssembleInput {
    double dPeakThreshold;
    double dSaddleThreshold;
    std::int64_t nMinMembers;
};

// Merges chains into groups and labels every particle with its group.
class ServiceAssembleGroups : public TraversePartition<AssembleInput,GroupCounts> {
public:
    explicit ServiceAssembleGroups(PST pst)
        : TraversePartition(pst,PST_ASSEMBLEGROUPS,"AssembleGroups") {}
protected:
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) override;
};
#endif
