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

#ifndef PST_HINCLUDED
#define PST_HINCLUDED

#include "mdlbase.h"

namespace hopchain { class Partition; }

#define pstAmCore(pst) ((pst)->nLeaves == 1)
#define pstNotCore(pst) ((pst)->nLeaves > 1)

typedef struct lclBlock {
    hopchain::Partition *part;
} LCL;

typedef struct pstContext {
    struct pstContext *pstLower;
    mdl::mdlBASE *mdl;
    LCL *plcl;
    int idSelf;
    int idUpper;
    int nLeaves;
    int nLower;
    int nUpper;
    int iLvl;
} *PST;

enum pst_service {
    PST_SRV_STOP=0, /* service 0 is always STOP and handled by MDL */
    PST_SETADD,
    PST_INITPARTITION,
    PST_GENERATECLUSTERS,
    PST_DENSITY,
    PST_BUILDCHAINS,
    PST_EXCHANGELINKS,
    PST_CHAINGRAPH,
    PST_ASSEMBLEGROUPS,
    PST_GROUPSTATS,
    PST_MAX_SERVICES
};

void pstInitialize(PST *ppst,mdl::mdlBASE *mdl,LCL *plcl);
void pstFinish(PST pst);
void pstAddServices(PST pst,mdl::mdlBASE *mdl);

#endif
