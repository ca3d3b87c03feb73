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

#include "gtest/gtest.h"
#include "mdl.h"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>
#include "Python.h"
#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>
#include "pst.h"
#include "TraversePST.h"
#include "master.h"
#include "parameters.h"
#include "core/partition.h"
#include "ic/clusters.h"
#include "ic/generateclusters.h"
#include "group/groupstats.h"
#include "group/chaintypes.h"

namespace {

enum test_service {
    PST_LOADCLUMP = PST_MAX_SERVICES,
    PST_CHECKLINKS,
    PST_CHECKGROUPS,
};

// Added to the ghost indices of domain 0 so that no worker owns them
constexpr std::int64_t ORPHAN_OFFSET = std::int64_t(1) << 40;

struct ClumpInput {
    int nClump;
    int nBackground;
    double center[3];
    double sigma;
    std::uint64_t iSeed;
    int bOrphanGhosts;
};

// One Gaussian clump over a uniform background, the same on every worker.
class ServiceLoadClump : public TraversePartition<ClumpInput,ParticleCounts> {
public:
    explicit ServiceLoadClump(PST pst)
        : TraversePartition(pst,PST_LOADCLUMP,"LoadClump") {}
protected:
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) override {
        auto in = static_cast<input *>(vin);
        auto out = static_cast<output *>(vout);
        auto part = pst->plcl->part;
        const auto L = part->Decomp().box();
        std::unique_ptr<gsl_rng,decltype(&gsl_rng_free)> rng(gsl_rng_alloc(gsl_rng_mt19937),gsl_rng_free);
        gsl_rng_set(rng.get(),in->iSeed);
        std::vector<hopchain::Bound::coord_type> r(in->nClump + in->nBackground);
        for (auto i=0u; i<r.size(); ++i) {
            for (auto d=0; d<3; ++d) {
                auto x = int(i) < in->nClump ? in->center[d] + gsl_ran_gaussian(rng.get(),in->sigma)
                         : L * gsl_rng_uniform(rng.get());
                x -= L * std::floor(x / L);
                r[i][d] = x < L ? x : 0.0;
            }
        }
        auto set = hopchain::SelectDomain(r,1.0 / r.size(),part->Decomp(),part->Domain());
        if (in->bOrphanGhosts && part->Domain() == 0) {
            for (auto i=0u; i<set.gidx.size(); ++i) {
                if (!part->bound().contains(set.r[i])) set.gidx[i] += ORPHAN_OFFSET;
            }
        }
        part->SetParticles(std::move(set.gidx),std::move(set.r),std::move(set.m));
        out->nLocal = part->Local();
        out->nInside = part->Inside();
        return sizeof(output);
    }
};

struct LinkCheck {
    std::uint64_t nTerminals;   // assigned padded terminals
    std::uint64_t nFound;       // terminals whose owned copy was found
    std::uint64_t nUnassigned;  // found, but the owned copy is in no chain
    std::uint64_t nMismatched;  // found in a different chain
    LinkCheck &operator+=(const LinkCheck &rhs) {
        nTerminals += rhs.nTerminals;
        nFound += rhs.nFound;
        nUnassigned += rhs.nUnassigned;
        nMismatched += rhs.nMismatched;
        return *this;
    }
};

// Compares the chain of every padded terminal with that of its owned copy
class ServiceCheckLinks : public TraversePartition<void,LinkCheck> {
public:
    explicit ServiceCheckLinks(PST pst)
        : TraversePartition(pst,PST_CHECKLINKS,"CheckLinks") {}
protected:
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) override {
        auto out = static_cast<output *>(vout);
        auto part = pst->plcl->part;
        std::vector<hopchain::LinkRecord> mine;
        for (auto i : part->paddedTerminals) mine.push_back(hopchain::LinkRecord{part->global(i),part->chainID[i]});
        auto all = pst->mdl->Allgatherv(mine);
        *out = LinkCheck{mine.size(),0,0,0};
        for (auto &rec : all) {
            auto li = part->lookup(rec.gidx);
            if (li < 0) continue;
            ++out->nFound;
            if (part->chainID[li] < 0) ++out->nUnassigned;
            else if (part->chainID[li] != rec.chainID) ++out->nMismatched;
        }
        return sizeof(output);
    }
};

struct GroupCheckInput {
    double dThreshold;
};

struct GroupCheck {
    std::uint64_t nBelowGrouped;   // owned particles under the threshold with a group
    std::uint64_t uChecksum;       // of every owned (gidx, groupID) pair
    GroupCheck &operator+=(const GroupCheck &rhs) {
        nBelowGrouped += rhs.nBelowGrouped;
        uChecksum += rhs.uChecksum;
        return *this;
    }
};

class ServiceCheckGroups : public TraversePartition<GroupCheckInput,GroupCheck> {
public:
    explicit ServiceCheckGroups(PST pst)
        : TraversePartition(pst,PST_CHECKGROUPS,"CheckGroups") {}
protected:
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) override {
        auto in = static_cast<input *>(vin);
        auto out = static_cast<output *>(vout);
        auto part = pst->plcl->part;
        *out = GroupCheck{0,0};
        for (auto i=0; i<part->Local(); ++i) {
            if (!part->inside(i)) continue;
            if (part->density[i] < in->dThreshold && part->groupID[i] >= 0) ++out->nBelowGrouped;
            auto h = std::uint64_t(part->global(i)) * 0x9E3779B97F4A7C15ull;
            out->uChecksum += h ^ std::uint64_t(part->groupID[i] + 1);
        }
        return sizeof(output);
    }
};

hop_parameters *parameters = nullptr;
MSR *msr = nullptr;
PST root = nullptr;

class ChainLinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        parameters->set("dThreshold",20.0);
        parameters->set("nSmooth",std::int64_t(32));
        parameters->set("dPadding",0.1);
        parameters->set("nMaxRounds",std::int64_t(0));
        parameters->set("nMinMembers",std::int64_t(0));
    }

    // A clump centred on the boundary between the two domains
    ParticleCounts LoadClump(bool bOrphanGhosts=false) {
        msr->InitPartition();
        ServiceLoadClump::input in;
        ServiceLoadClump::output out;
        in.nClump = 400;
        in.nBackground = 400;
        in.center[0] = in.center[1] = in.center[2] = 0.5;
        in.sigma = 0.03;
        in.iSeed = 42;
        in.bOrphanGhosts = bOrphanGhosts;
        root->mdl->RunService(PST_LOADCLUMP,sizeof(in),&in,&out);
        return out;
    }

    LinkCheck CheckLinks() {
        LinkCheck out;
        root->mdl->RunService(PST_CHECKLINKS,&out);
        return out;
    }

    GroupCheck CheckGroups() {
        ServiceCheckGroups::input in;
        ServiceCheckGroups::output out;
        in.dThreshold = parameters->dThreshold();
        root->mdl->RunService(PST_CHECKGROUPS,sizeof(in),&in,&out);
        return out;
    }
};

TEST_F(ChainLinkTest, EveryParticleIsOwnedOnce) {
    auto counts = LoadClump();
    EXPECT_EQ(counts.nInside,800u);
    EXPECT_GT(counts.nLocal,counts.nInside);
}

TEST_F(ChainLinkTest, StraddlingClumpIsOneGroup) {
    ASSERT_EQ(root->mdl->Threads(),2);
    LoadClump();
    msr->Density();
    auto nChains = msr->BuildChains();
    EXPECT_GE(nChains,2u);
    std::uint64_t nDropped;
    auto nRounds = msr->ExchangeLinks(&nDropped);
    EXPECT_LE(nRounds,3u);
    EXPECT_EQ(nDropped,0u);

    // Both copies of every boundary particle now carry the same chain
    auto links = CheckLinks();
    EXPECT_GT(links.nTerminals,0u);
    EXPECT_EQ(links.nFound,links.nTerminals);
    EXPECT_EQ(links.nUnassigned,0u);
    EXPECT_EQ(links.nMismatched,0u);

    msr->ChainGraph();
    EXPECT_EQ(msr->AssembleGroups(),1u);

    ServiceGroupStats::output stats;
    root->mdl->RunService(PST_GROUPSTATS,&stats);
    EXPECT_EQ(stats.nGrouped + stats.nUngrouped,800u);
    auto part = root->plcl->part;
    ASSERT_EQ(part->groupMembers.size(),1u);
    EXPECT_EQ(std::uint64_t(part->groupMembers[0]),stats.nGrouped);
    EXPECT_GT(stats.nGrouped,300u);
    EXPECT_LT(stats.nGrouped,450u);
    EXPECT_GT(part->groupDensity[0],parameters->dPeakThreshold());
}

TEST_F(ChainLinkTest, MinimumMembersPurgesGroups) {
    parameters->set("nMinMembers",std::int64_t(800));
    LoadClump();
    msr->Density();
    msr->BuildChains();
    msr->ExchangeLinks(nullptr);
    msr->ChainGraph();
    EXPECT_EQ(msr->AssembleGroups(),0u);
    ServiceGroupStats::output stats;
    root->mdl->RunService(PST_GROUPSTATS,&stats);
    EXPECT_EQ(stats.nGrouped,0u);
}

TEST_F(ChainLinkTest, ChainsMatchOnlyAfterExchange) {
    LoadClump();
    msr->Density();
    msr->BuildChains();
    auto before = CheckLinks();
    EXPECT_GT(before.nMismatched,0u);
    msr->ExchangeLinks(nullptr);
    EXPECT_EQ(CheckLinks().nMismatched,0u);
}

TEST_F(ChainLinkTest, UnownedRecordsAreCountedOnce) {
    LoadClump(true);
    msr->Density();
    msr->BuildChains();
    std::uint64_t nDropped;
    auto nRounds = msr->ExchangeLinks(&nDropped);
    EXPECT_GE(nRounds,2u);
    auto links = CheckLinks();
    EXPECT_GT(links.nTerminals,links.nFound);
    EXPECT_EQ(nDropped,links.nTerminals - links.nFound);
    EXPECT_EQ(links.nMismatched,0u);
}

TEST_F(ChainLinkTest, RoundLimitIsEnforced) {
    parameters->set("nMaxRounds",std::int64_t(1));
    LoadClump();
    msr->Density();
    msr->BuildChains();
    EXPECT_THROW(msr->ExchangeLinks(nullptr),std::runtime_error);
}

TEST_F(ChainLinkTest, GeneratedClusters) {
    parameters->set("nParticles",std::int64_t(4000));
    parameters->set("nClusters",std::int64_t(4));
    parameters->set("dClusterRadius",0.02);
    auto summary = msr->Hop();
    EXPECT_GE(summary.nGroups,1u);
    EXPECT_LE(summary.nGroups,8u);
    EXPECT_LE(summary.nGrouped,4000u);
    EXPECT_GT(summary.nGrouped,0u);
    EXPECT_EQ(summary.nDropped,0u);
    EXPECT_EQ(CheckGroups().nBelowGrouped,0u);
}

TEST_F(ChainLinkTest, RepeatedRunsGiveTheSameGroups) {
    parameters->set("nParticles",std::int64_t(4000));
    parameters->set("nClusters",std::int64_t(4));
    parameters->set("dClusterRadius",0.02);
    auto first = msr->Hop();
    auto check = CheckGroups();
    auto second = msr->Hop();
    EXPECT_EQ(second.nGroups,first.nGroups);
    EXPECT_EQ(second.nGrouped,first.nGrouped);
    EXPECT_EQ(CheckGroups().uChecksum,check.uChecksum);
}

} // namespace

/*
** This function is called at the very start by every thread.
** It returns the "worker context"; in this case the PST.
*/
void *worker_init(MDL vmdl) {
    auto mdl = static_cast<mdl::mdlBASE *>(reinterpret_cast<mdl::mdlClass *>(vmdl));
    PST pst;
    LCL *plcl = new LCL;
    plcl->part = nullptr;
    pstInitialize(&pst,mdl,plcl);
    pstAddServices(pst,mdl);
    mdl->AddService(std::make_unique<ServiceLoadClump>(pst));
    mdl->AddService(std::make_unique<ServiceCheckLinks>(pst));
    mdl->AddService(std::make_unique<ServiceCheckGroups>(pst));
    return pst;
}

/*
** This function is called at the very end for every thread.
** It needs to destroy the worker context (PST).
*/
void worker_done(MDL mdl, void *ctx) {
    PST pst = reinterpret_cast<PST>(ctx);
    LCL *plcl = pst->plcl;
    pstFinish(pst);
    delete plcl;
}

/*
** This is invoked for the "master" process after the worker has been setup.
*/
int master(MDL mdl,void *vpst) {
    root = reinterpret_cast<PST>(vpst);
    int argc = mdlGetArgc(mdl);
    char **argv = mdlGetArgv(mdl);
    int rc;

    Py_Initialize();
    {
        hop_parameters hp;
        hp.set("bVStep",false);
        parameters = &hp;
        MSR m(mdl,root,hp);
        msr = &m;
        ::testing::InitGoogleTest(&argc, argv);
        rc = RUN_ALL_TESTS();
        msr = nullptr;
        parameters = nullptr;
    }
    Py_Finalize();
    return rc;
}

int main(int argc,char **argv) {
    return mdlLaunch(argc,argv,master,worker_init,worker_done);
}
