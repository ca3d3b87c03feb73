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

#include "pst.h"
#include "core/partition.h"
#include "core/setadd.h"
#include "core/initpartition.h"
#include "ic/generateclusters.h"
#include "smooth/smoothdensity.h"
#include "group/buildchains.h"
#include "group/exchangelinks.h"
#include "group/chaingraph.h"
#include "group/assemblegroups.h"
#include "group/groupstats.h"

void pstAddServices(PST pst,mdl::mdlBASE *mdl) {
    mdl->AddService(std::make_unique<ServiceSetAdd>(pst));
    mdl->AddService(std::make_unique<ServiceInitPartition>(pst));
    mdl->AddService(std::make_unique<ServiceGenerateClusters>(pst));
    mdl->AddService(std::make_unique<ServiceDensity>(pst));
    mdl->AddService(std::make_unique<ServiceBuildChains>(pst));
    mdl->AddService(std::make_unique<ServiceExchangeLinks>(pst));
    mdl->AddService(std::make_unique<ServiceChainGraph>(pst));
    mdl->AddService(std::make_unique<ServiceAssembleGroups>(pst));
    mdl->AddService(std::make_unique<ServiceGroupStats>(pst));
}

void pstInitialize(PST *ppst,mdl::mdlBASE *mdl,LCL *plcl) {
    PST pst;

    pst = (PST)malloc(sizeof(struct pstContext));
    mdlassert(mdl,pst != NULL);
    *ppst = pst;
    pst->plcl = plcl;
    pst->mdl = mdl;
    pst->idSelf = mdl->Self();
    pst->pstLower = NULL;
    pst->idUpper = -1;  /* invalidate upper 'id' */
    pst->nLeaves = 1;
    pst->nLower = 0;
    pst->nUpper = 0;
    pst->iLvl = 0;
}

void pstFinish(PST pst) {
    PST pstKill;

    while (pst) {
        pstKill = pst;
        if (pst->nLeaves == 1 && pst->plcl->part) {
            delete pst->plcl->part;
            pst->plcl->part = nullptr;
        }
        pst = pst->pstLower;
        free(pstKill);
    }
}
