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

#include "mdl.h"
#include <string.h>
#include <stdexcept>
#include <numeric>
#include <algorithm>
#include <thread>
#include "fmt/format.h"

using namespace mdl;

static thread_local mdlClass *mdl_this = nullptr;

threadShared::threadShared(int nThreads)
    : nThreads(nThreads), mailbox(nThreads), slots(nThreads), sizes(nThreads) {
    pthread_barrier_init(&barrier,NULL,nThreads);
}

threadShared::~threadShared() {
    pthread_barrier_destroy(&barrier);
}

mdlClass::mdlClass(threadShared *shared, int iThread,
                   int (*fcnMaster)(MDL,void *),void *(*fcnWorkerInit)(MDL),void (*fcnWorkerDone)(MDL,void *),
                   int argc, char **argv)
    : mdlBASE(argc,argv), shared(shared), worker_ctx(nullptr),
      fcnMaster(fcnMaster), fcnWorkerInit(fcnWorkerInit), fcnWorkerDone(fcnWorkerDone) {
    nThreads = shared->nThreads;
    idSelf = iThread;
    nProcs = 1;
    iProc = 0;
    nCores = nThreads;
    iCore = iThread;
    iProcToThread = {0,nThreads};
}

mdlClass::~mdlClass() {
}

int mdlLaunch(int argc,char **argv,int (*fcnMaster)(MDL,void *),void *(*fcnWorkerInit)(MDL),void (*fcnWorkerDone)(MDL,void *)) {
    int i,j,nThreads = 1;
    bool bThreads = false;
    const char *p;
    std::string achDiag;

    /*
    ** Do some low level argument parsing for number of threads, and
    ** diagnostic flag!
    */
    if (argv) {
        for (argc = 0; argv[argc]; argc++) {}
        for (i = j = 1; i<argc; ++i) {
            if (!strcmp(argv[i], "-sz")) {
                if (argv[++i]) {
                    nThreads = atoi(argv[i]);
                    bThreads = true;
                }
            }
            else if (!strcmp(argv[i], "+d") && achDiag.empty()) {
                p = getenv("MDL_DIAGNOSTIC");
                if (!p) p = getenv("HOME");
                achDiag = p ? p : "/tmp";
            }
            else {
                if (i!=j) argv[j] = argv[i];
                ++j;
            }
        }
        argc = j;
        argv[argc] = nullptr;
    }
    if (!bThreads) {
        if ( (p=getenv("OMP_NUM_THREADS")) != NULL ) nThreads = atoi(p);
    }
    if (nThreads < 1) {
        fmt::print(stderr,"Invalid number of threads: {}\n",nThreads);
        return 1;
    }

    threadShared shared(nThreads);
    std::vector<std::unique_ptr<mdlClass>> mdl;
    for (i=0; i<nThreads; ++i)
        mdl.emplace_back(std::make_unique<mdlClass>(&shared,i,fcnMaster,fcnWorkerInit,fcnWorkerDone,argc,argv));

    const char *pszDiag = achDiag.empty() ? nullptr : achDiag.c_str();
    std::vector<std::thread> threads;
    for (i=1; i<nThreads; ++i)
        threads.emplace_back(&mdlClass::Run,mdl[i].get(),pszDiag);
    auto exit_code = mdl[0]->Run(pszDiag);
    for (auto &t : threads) t.join();
    return exit_code;
}

int mdlClass::Run(const char *pszDiag) {
    int exit_code = 0;
    mdl_this = this;
#ifdef USE_BT
    if (Self()==0) register_backtrace();
#endif
    try {
        if (pszDiag) OpenDiagnostics(pszDiag);
        worker_ctx = (*fcnWorkerInit)(static_cast<MDL>(static_cast<mdlBASE *>(this)));
        Barrier(); // Every thread has registered its services
        if (Self()) Handler();
        else {
            exit_code = (*fcnMaster)(static_cast<MDL>(static_cast<mdlBASE *>(this)),worker_ctx);
            stop_workers();
        }
        (*fcnWorkerDone)(static_cast<MDL>(static_cast<mdlBASE *>(this)),worker_ctx);
    }
    catch (const std::exception &e) {
        fmt::print(stderr,"ERROR on thread {}: {}\n",Self(),e.what());
        fflush(stderr);
        mdlAbort(static_cast<MDL>(static_cast<mdlBASE *>(this)));
    }
    return exit_code;
}

void mdlClass::stop_workers() {
    for (auto id=1; id<Threads(); ++id) {
        auto rID = ReqService(id,SRV_STOP);
        GetReply(rID);
    }
}

void mdlClass::Send(const void *buf, int nBytes, int idTo, int tag) {
    assert(idTo >= 0 && idTo < Threads());
    MBX M;
    M.idFrom = Self();
    M.tag = tag;
    M.data.assign(static_cast<const char *>(buf),static_cast<const char *>(buf) + nBytes);
    std::unique_lock<std::mutex> lock(shared->mux);
    shared->mailbox[idTo].emplace_back(std::move(M));
    shared->sigRec.notify_all();
}

MBX mdlClass::Recv(int idFrom, int tag) {
    auto &box = shared->mailbox[Self()];
    std::unique_lock<std::mutex> lock(shared->mux);
    for (;;) {
        auto it = std::find_if(box.begin(),box.end(),
        [idFrom,tag](const MBX &M) {return M.tag==tag && (idFrom<0 || M.idFrom==idFrom);});
        if (it != box.end()) {
            MBX M = std::move(*it);
            box.erase(it);
            return M;
        }
        shared->sigRec.wait(lock);
    }
}

void mdlClass::Handler() {
    int sid;
    do {
        auto M = Recv(-1,MDL_TAG_REQ);
        auto phi = reinterpret_cast<SRVHEAD *>(M.data.data());
        assert(M.data.size() == phi->nInBytes + sizeof(SRVHEAD));
        sid = phi->sid;
        std::vector<char> reply(nMaxOutBytes > 0 ? nMaxOutBytes : 1);
        auto nOutBytes = RunService(sid,phi->nInBytes,phi + 1,reply.data());
        Send(reply.data(),nOutBytes,phi->idFrom,MDL_TAG_RPL);
    } while (sid != SRV_STOP);
}

// The request id is the target thread: a thread has at most one request
// outstanding to any other thread.
int mdlClass::ReqService(int id, int sid, void *vin, int nIn) {
    std::vector<char> buffer(sizeof(SRVHEAD) + nIn);
    auto phi = reinterpret_cast<SRVHEAD *>(buffer.data());
    phi->idFrom = Self();
    phi->sid = sid;
    phi->nInBytes = nIn;
    if (nIn) memcpy(phi + 1, vin, nIn);
    Send(buffer.data(),buffer.size(),id,MDL_TAG_REQ);
    return id;
}

int mdlClass::GetReply(int rID, void *vout) {
    auto M = Recv(rID,MDL_TAG_RPL);
    if (vout && M.data.size()) memcpy(vout,M.data.data(),M.data.size());
    return M.data.size();
}

void mdlClass::Barrier() {
    pthread_barrier_wait(&shared->barrier);
}

void mdlClass::Allgather(const void *sbuf, int nBytes, void *rbuf) {
    shared->slots[Self()] = sbuf;
    Barrier();
    auto out = static_cast<char *>(rbuf);
    for (auto i=0; i<Threads(); ++i) memcpy(out + i*nBytes,shared->slots[i],nBytes);
    Barrier();
}

void mdlClass::Allgatherv(const void *sbuf, int nBytes, void *rbuf, const int *counts, const int *displs) {
    shared->slots[Self()] = sbuf;
    shared->sizes[Self()] = nBytes;
    Barrier();
    auto out = static_cast<char *>(rbuf);
    for (auto i=0; i<Threads(); ++i) {
        if (shared->sizes[i] != counts[i])
            throw std::runtime_error(fmt::format("Allgatherv: thread {} sent {} bytes, expected {}",i,shared->sizes[i],counts[i]));
        if (counts[i]) memcpy(out + displs[i],shared->slots[i],counts[i]);
    }
    Barrier();
}

template<typename T>
static void reduce(const std::vector<const void *> &slots,void *rbuf,int count,mdl_op op) {
    auto out = static_cast<T *>(rbuf);
    std::copy_n(static_cast<const T *>(slots[0]),count,out);
    for (auto i=1; i<slots.size(); ++i) {
        auto in = static_cast<const T *>(slots[i]);
        for (auto j=0; j<count; ++j) {
            switch (op) {
            case MDL_SUM: out[j] += in[j]; break;
            case MDL_MAX: out[j] = std::max(out[j],in[j]); break;
            case MDL_MIN: out[j] = std::min(out[j],in[j]); break;
            case MDL_LOR: out[j] = (out[j] || in[j]) ? 1 : 0; break;
            }
        }
    }
}

void mdlClass::Allreduce(const void *sbuf, void *rbuf, int count, mdl_datatype type, mdl_op op) {
    shared->slots[Self()] = sbuf;
    Barrier();
    switch (type) {
    case MDL_INT32:  reduce<std::int32_t>(shared->slots,rbuf,count,op); break;
    case MDL_INT64:  reduce<std::int64_t>(shared->slots,rbuf,count,op); break;
    case MDL_UINT64: reduce<std::uint64_t>(shared->slots,rbuf,count,op); break;
    case MDL_DOUBLE: reduce<double>(shared->slots,rbuf,count,op); break;
    }
    Barrier();
}

int mdlClass::Sendrecv(const void *sbuf, int nSend, int idTo,
                       void *rbuf, int nRecv, int idFrom, int tag) {
    if (idTo >= 0) Send(sbuf,nSend,idTo,MDL_TAG_USER+tag);
    if (idFrom < 0) return 0;
    auto M = Recv(idFrom,MDL_TAG_USER+tag);
    if (M.data.size() != nRecv)
        throw std::runtime_error(fmt::format("Sendrecv: expected {} bytes from {} but received {}",nRecv,idFrom,M.data.size()));
    if (nRecv) memcpy(rbuf,M.data.data(),nRecv);
    return nRecv;
}

void mdlAbort(MDL mdl) {
    abort();
}

void *mdlWORKER(void) {
    return mdl_this ? mdl_this->WorkerContext() : nullptr;
}

MDL mdlMDL(void) {
    return static_cast<MDL>(static_cast<mdlBASE *>(mdl_this));
}
