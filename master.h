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

#ifndef MASTER_HINCLUDED
#define MASTER_HINCLUDED
#include "hopchain_config.h"
#include <stdint.h>
#include "pst.h"
#include "parameters.h"

// IMPORTANT: If you change the timers here then you need to change
// their names in master.cxx (timer_names)
enum msrTimers {
    TIMER_GENERATE = 0,
    TIMER_DENSITY,
    TIMER_CHAINS,
    TIMER_EXCHANGE,
    TIMER_GRAPH,
    TIMER_GROUPS,
    TIMER_NONE,
    TOTAL_TIMERS
};

struct HopSummary {
    uint64_t nChains;
    uint64_t nRounds;
    uint64_t nDropped;
    uint64_t nEdges;
    uint64_t nGroups;
    uint64_t nGrouped;
};

class MSR {
protected:
    const PST pst;
    mdl::mdlBASE *mdl;
    const hop_parameters &parameters;
    bool bVStep;
    int64_t nGlobalParticles = 0;
    struct {
        double sec;
        double acc;
    } ti[TOTAL_TIMERS];

public:
    explicit MSR(MDL mdl,PST pst,const hop_parameters &parameters);
    void msrprintf(const char *Format, ... ) const;
    static double Time();
    void TimerStart(int iTimer);
    void TimerStop(int iTimer);
    double TimerGet(int iTimer);
    double TimerGetAcc(int iTimer);

public:
    void InitPartition();
    uint64_t GenerateClusters();
    void Density();
    uint64_t BuildChains();
    uint64_t ExchangeLinks(uint64_t *pnDropped);
    uint64_t ChainGraph();
    uint64_t AssembleGroups();
    HopSummary Hop();
    void Report(const HopSummary &summary);
};
#endif
