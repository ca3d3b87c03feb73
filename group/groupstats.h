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

#ifndef SERVICE_GROUPSTATS_H
#define SERVICE_GROUPSTATS_H
#include <cstdint>
#include "TraversePST.h"

struct GroupStats {
    std::uint64_t nGrouped;    // owned particles in a group
    std::uint64_t nUngrouped;
    GroupStats &operator+=(const GroupStats &rhs) {
        nGrouped += rhs.nGrouped;
        nUngrouped += rhs.nUngrouped;
        return *this;
    }
};

class ServiceGroupStats : public TraversePartition<void,GroupStats> {
public:
    explicit ServiceGroupStats(PST pst)
        : TraversePartition(pst,PST_GROUPSTATS,"GroupStats") {}
protected:
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) override;
};
#endif
