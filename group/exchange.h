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

#ifndef GROUP_EXCHANGE_H
#define GROUP_EXCHANGE_H
#include <cstdint>
#include <map>
#include "core/partition.h"
#include "mdlbase.h"

namespace hopchain {

struct ExchangeStats {
    std::uint64_t nChanged;   // particles relabelled on all workers
    std::uint64_t nSent;      // records sent by all workers
    std::uint64_t nDropped;   // records with no owned particle to land on
};

/*
** Chain id relabelling for one round. Joining two ids points the larger
** at the smaller so every connected set resolves to its minimum.
*/
class ChainAlias {
    std::map<std::int64_t,std::int64_t> parent;
public:
    std::int64_t find(std::int64_t c);
    void join(std::int64_t a,std::int64_t b);
    bool empty() const {return parent.empty();}
};

/// @brief One reconciliation round over all 26 neighbour directions
/// Every worker must call this together. The returned counts are global.
ExchangeStats ExchangeRound(Partition &part, mdl::mdlBASE *mdl);

} // namespace hopchain

#endif
