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

#include "master.h"
#include <stdio.h>
#include <stdarg.h>
#include <cinttypes>
#include <sys/time.h>
#include <algorithm>
#include <stdexcept>
#include <numeric>
#include <vector>
#include "fmt/format.h"

#include "core/setadd.h"
#include "core/initpartition.h"
#include "core/partition.h"
#include "ic/generateclusters.h"
#include "smooth/smoothdensity.h"
#include "group/buildchains.h"
#include "group/exchangelinks.h"
#include "group/chaingraph.h"
#include "group/assemblegroups.h"
#include "group/groupstats.h"

// The order should be the same than in the enumerate above!
static const char *timer_names[TOTAL_TIMERS] = {
    "Generate", "Density", "Chains", "Exchange", "Graph", "Groups", "Other",
};

void MSR::msrprintf(const char *Format, ... ) const {
    va_list ap;
    if (bVStep) {
        va_start(ap,Format);
        vprintf(Format,ap);
        va_end(ap);
    }
}

double MSR::Time() {
    struct timeval tv;
    gettimeofday(&tv,NULL);
    return (tv.tv_sec+(tv.tv_usec*1e-6));
}

void MSR::TimerStart(int iTimer) {
    ti[iTimer].sec = Time();
}

void MSR::TimerStop(int iTimer) {
    ti[iTimer].sec = Time() - ti[iTimer].sec;
    ti[iTimer].acc += ti[iTimer].sec;
}

// Query the timing of the last call, given that TimerStop was called
// for that iTimer
double MSR::TimerGet(int iTimer) {
    return ti[iTimer].sec;
}

double MSR::TimerGetAcc(int iTimer) {
    return ti[iTimer].acc;
}

MSR::MSR(MDL vmdl,PST pst,const hop_parameters &parameters)
    : pst(pst), mdl(static_cast<mdl::mdlBASE *>(vmdl)), parameters(parameters) {
    bVStep = parameters.bVStep();
    for (auto &t : ti) t.sec = t.acc = 0.0;
    /*
    ** Create the processor subset tree.
    */
    auto nThreads = mdl->Threads();
    if (nThreads > 1) {
        msrprintf("Adding %d through %d to the PST\n",1,nThreads);
        ServiceSetAdd::input inAdd(nThreads);
        mdl->RunService(PST_SETADD,sizeof(inAdd),&inAdd);
    }
}

void MSR::InitPartition() {
    ServiceInitPartition::input in;
    auto nDomains = parameters.nDomains();
    auto bPeriodic = parameters.bPeriodic();
    for (auto d=0; d<3; ++d) {
        in.nGrid[d] = nDomains[d];
        in.bPeriodic[d] = bPeriodic[d];
    }
    in.dBoxSize = parameters.dBoxSize();
    in.dPadding = parameters.dPadding();
    mdl->RunService(PST_INITPARTITION,sizeof(in),&in);
}

uint64_t MSR::GenerateClusters() {
    ServiceGenerateClusters::input in;
    ServiceGenerateClusters::output out;
    in.nParticles = parameters.nParticles();
    in.nClusters = parameters.nClusters();
    in.dClusterFraction = parameters.dClusterFraction();
    in.dClusterRadius = parameters.dClusterRadius();
    in.iSeed = parameters.iSeed();
    TimerStart(TIMER_GENERATE);
    mdl->RunService(PST_GENERATECLUSTERS,sizeof(in),&in,&out);
    TimerStop(TIMER_GENERATE);
    nGlobalParticles = out.nInside;
    msrprintf("Generated %" PRIu64 " particles (%" PRIu64 " with ghosts) in %d clusters in %.2f secs\n",
              out.nInside,out.nLocal,in.nClusters,TimerGet(TIMER_GENERATE));
    return out.nInside;
}

void MSR::Density() {
    ServiceDensity::input in;
    ServiceDensity::output out;
    in.nSmooth = parameters.nSmooth();
    in.nMerge = parameters.nMerge();
    in.dThreshold = parameters.dThreshold();
    TimerStart(TIMER_DENSITY);
    mdl->RunService(PST_DENSITY,sizeof(in),&in,&out);
    TimerStop(TIMER_DENSITY);
    nGlobalParticles = out.nInside;
    msrprintf("Density calculation complete in %.2f secs, building chains...\n",TimerGet(TIMER_DENSITY));
    msrprintf("... %" PRIu64 " of %" PRIu64 " particles above %g, %" PRIu64 " local maxima, densest %g\n",
              out.nAbove,out.nInside,in.dThreshold,out.nPeaks,out.dMaxDensity);
}

uint64_t MSR::BuildChains() {
    ServiceBuildChains::input in;
    ServiceBuildChains::output out;
    in.dThreshold = parameters.dThreshold();
    TimerStart(TIMER_CHAINS);
    mdl->RunService(PST_BUILDCHAINS,sizeof(in),&in,&out);
    TimerStop(TIMER_CHAINS);
    msrprintf("Chain search complete in %.2f secs, %" PRIu64 " chains (%" PRIu64 " end in padding), "
              "reconciling boundaries...\n",TimerGet(TIMER_CHAINS),out.nChains,out.nPadded);
    return out.nChains;
}

// Repeat exchange rounds until no chain id changes anywhere. A round can
// only lower ids, so the particle count bounds the number of rounds.
// Every round resends all padded terminals, so the drops of the last
// round are the records that never found an owner.
uint64_t MSR::ExchangeLinks(uint64_t *pnDropped) {
    ServiceExchangeLinks::input in;
    ServiceExchangeLinks::output out;
    int64_t nMaxRounds = parameters.nMaxRounds() > 0 ? parameters.nMaxRounds() : std::max<int64_t>(nGlobalParticles,1);
    uint64_t nDropped = 0;
    TimerStart(TIMER_EXCHANGE);
    in.iRound = 0;
    do {
        if (in.iRound >= nMaxRounds)
            throw std::runtime_error(fmt::format("chain reconciliation did not converge in {} rounds",nMaxRounds));
        ++in.iRound;
        mdl->RunService(PST_EXCHANGELINKS,sizeof(in),&in,&out);
        nDropped = out.nDropped;
        msrprintf("... %d round%s, %" PRIu64 " records, %" PRIu64 " particles relabelled\n",
                  in.iRound,in.iRound==1?"":"s",out.nSent,out.nChanged);
    } while (out.nChanged);
    TimerStop(TIMER_EXCHANGE);
    msrprintf("Boundary reconciliation complete in %.2f secs, building chain graph...\n",TimerGet(TIMER_EXCHANGE));
    if (pnDropped) *pnDropped = nDropped;
    return in.iRound;
}

uint64_t MSR::ChainGraph() {
    ServiceChainGraph::input in;
    ServiceChainGraph::output out;
    in.nMerge = parameters.nMerge();
    TimerStart(TIMER_GRAPH);
    mdl->RunService(PST_CHAINGRAPH,sizeof(in),&in,&out);
    TimerStop(TIMER_GRAPH);
    msrprintf("Chain graph complete in %.2f secs, %" PRIu64 " chains and %" PRIu64 " edges, merging...\n",
              TimerGet(TIMER_GRAPH),out.nChains,out.nEdges);
    return out.nEdges;
}

uint64_t MSR::AssembleGroups() {
    ServiceAssembleGroups::input in;
    ServiceAssembleGroups::output out;
    in.dPeakThreshold = parameters.dPeakThreshold();
    in.dSaddleThreshold = parameters.dSaddleThreshold();
    in.nMinMembers = parameters.nMinMembers();
    TimerStart(TIMER_GROUPS);
    mdl->RunService(PST_ASSEMBLEGROUPS,sizeof(in),&in,&out);
    TimerStop(TIMER_GROUPS);
    msrprintf("Group assembly complete in %.2f secs, %" PRIu64 " groups\n",TimerGet(TIMER_GROUPS),out.nGroups);
    if (out.nPurged) msrprintf("... %" PRIu64 " groups had fewer than %" PRId64 " members\n",out.nPurged,in.nMinMembers);
    return out.nGroups;
}

HopSummary MSR::Hop() {
    HopSummary summary {};
    auto sec = Time();
    InitPartition();
    GenerateClusters();
    Density();
    summary.nChains = BuildChains();
    summary.nRounds = ExchangeLinks(&summary.nDropped);
    summary.nEdges = ChainGraph();
    summary.nGroups = AssembleGroups();

    ServiceGroupStats::output stats;
    mdl->RunService(PST_GROUPSTATS,&stats);
    summary.nGrouped = stats.nGrouped;
    msrprintf("Chain linkage complete in %.2f secs\n",Time() - sec);
    return summary;
}

void MSR::Report(const HopSummary &summary) {
    fmt::print("{} groups, {} of {} particles grouped ({} chains, {} exchange rounds)\n",
               summary.nGroups,summary.nGrouped,nGlobalParticles,summary.nChains,summary.nRounds);
    fmt::print("{} boundary link records had no owned particle\n",summary.nDropped);
    // The group tables are the same on every worker
    auto part = pst->plcl->part;
    std::vector<int64_t> order(part->groupMembers.size());
    std::iota(order.begin(),order.end(),0);
    std::stable_sort(order.begin(),order.end(),[part](int64_t a,int64_t b) {
        return part->groupMembers[a] > part->groupMembers[b];
    });
    fmt::print("{:>8} {:>10} {:>14}\n","group","members","densest");
    for (auto g : order) {
        fmt::print("{:>8} {:>10} {:>14.6g}\n",g,part->groupMembers[g],part->groupDensity[g]);
    }
    if (bVStep) {
        for (auto i=0; i<TIMER_NONE; ++i) {
            fmt::print("{:>10}: {:.3f} secs\n",timer_names[i],TimerGetAcc(i));
        }
    }
}
