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
#ifdef HAVE_SIGNAL_H
    #include <signal.h>
#endif
#include "fmt/format.h"

using namespace mdl;

static mdlClass *mdl_global = nullptr;

static MPI_Datatype mpi_type(mdl_datatype type) {
    switch (type) {
    case MDL_INT32:  return MPI_INT32_T;
    case MDL_INT64:  return MPI_INT64_T;
    case MDL_UINT64: return MPI_UINT64_T;
    case MDL_DOUBLE: return MPI_DOUBLE;
    }
    throw std::invalid_argument("unknown mdl_datatype");
}

static MPI_Op mpi_op(mdl_op op) {
    switch (op) {
    case MDL_SUM: return MPI_SUM;
    case MDL_MAX: return MPI_MAX;
    case MDL_MIN: return MPI_MIN;
    case MDL_LOR: return MPI_LOR;
    }
    throw std::invalid_argument("unknown mdl_op");
}

static void check_mpi(int rc, const char *what) {
    if (rc != MPI_SUCCESS) {
        char ach[MPI_MAX_ERROR_STRING];
        int n;
        MPI_Error_string(rc, ach, &n);
        throw std::runtime_error(fmt::format("{}: {}",what,ach));
    }
}

#ifdef HAVE_SIGNAL_H
static void TERM_handler(int signo) {
    MPI_Abort(MPI_COMM_WORLD,130);
}
#endif

mdlClass::mdlClass(int (*fcnMaster)(MDL,void *),void *(*fcnWorkerInit)(MDL),void (*fcnWorkerDone)(MDL,void *),
                   int argc, char **argv)
    : mdlBASE(argc,argv), commMDL(MPI_COMM_WORLD), fcnMaster(fcnMaster),
      fcnWorkerInit(fcnWorkerInit), fcnWorkerDone(fcnWorkerDone), worker_ctx(nullptr) {
}

mdlClass::~mdlClass() {
}

int mdlLaunch(int argc,char **argv,int (*fcnMaster)(MDL,void *),void *(*fcnWorkerInit)(MDL),void (*fcnWorkerDone)(MDL,void *)) {
    mdlClass mdl(fcnMaster,fcnWorkerInit,fcnWorkerDone,argc,argv);
    return mdl.Launch();
}

int mdlClass::Launch() {
    int i,j,rc,thread_support;
    int bDiag = 0;
    int exit_code = 0;
    const char *p;
    std::string achDiag;

    /*
    ** Do some low level argument parsing for the diagnostic flag!
    */
    if (argv) {
        for (argc = 0; argv[argc]; argc++) {}
        for (i = j = 1; i<argc; ++i) {
            if (!strcmp(argv[i], "+d") && !bDiag) {
                p = getenv("MDL_DIAGNOSTIC");
                if (!p) p = getenv("HOME");
                achDiag = p ? p : "/tmp";
                bDiag = 1;
            }
            else {
                if (i!=j) argv[j] = argv[i];
                ++j;
            }
        }
        argc = j;
        argv[argc] = nullptr;
    }

    /* MPI Initialization */
    commMDL = MPI_COMM_WORLD;
    rc = MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED,&thread_support);
    if (rc!=MPI_SUCCESS) {
        char ach[MPI_MAX_ERROR_STRING];
        MPI_Error_string(rc, ach, &i);
        perror(ach);
        MPI_Abort(commMDL,rc);
    }
#ifdef HAVE_SIGNAL_H
    signal(SIGINT,TERM_handler);
#endif
    MPI_Comm_size(commMDL, &nProcs);
    MPI_Comm_rank(commMDL, &iProc);
    nThreads = nProcs;
    idSelf = iProc;
    nCores = 1;
    iCore = 0;

    iProcToThread.resize(nProcs+1);
    std::iota(iProcToThread.begin(),iProcToThread.end(),0);
    mdl_global = this;

#ifdef USE_BT
    register_backtrace();
#endif
    try {
        if (bDiag) OpenDiagnostics(achDiag.c_str());
        worker_ctx = (*fcnWorkerInit)(static_cast<MDL>(static_cast<mdlBASE *>(this)));
        input_buffer.resize(sizeof(SRVHEAD) + nMaxInBytes);
        reply_buffer.resize(nMaxOutBytes > 0 ? nMaxOutBytes : 1);
        MPI_Barrier(commMDL);
        if (Self()) Handler();
        else exit_code = run_master();
        (*fcnWorkerDone)(static_cast<MDL>(static_cast<mdlBASE *>(this)),worker_ctx);
    }
    catch (const std::exception &e) {
        fmt::print(stderr,"ERROR on thread {} ({}): {}\n",Self(),nodeName,e.what());
        fflush(stderr);
        MPI_Abort(commMDL,1);
    }

    MPI_Barrier(commMDL);
    MPI_Finalize();
    return exit_code;
}

int mdlClass::run_master() {
    auto exit_code = (*fcnMaster)(static_cast<MDL>(static_cast<mdlBASE *>(this)),worker_ctx);
    stop_workers();
    return exit_code;
}

void mdlClass::stop_workers() {
    for (auto id=1; id<Threads(); ++id) {
        auto rID = ReqService(id,SRV_STOP);
        GetReply(rID);
    }
}

void mdlClass::Handler() {
    auto phi = reinterpret_cast<SRVHEAD *>(input_buffer.data());
    char *pszIn = reinterpret_cast<char *>(phi + 1);
    int sid,nOutBytes,nBytes;
    MPI_Status status;

    do {
        check_mpi(MPI_Recv(input_buffer.data(),input_buffer.size(),MPI_BYTE,MPI_ANY_SOURCE,MDL_TAG_REQ,commMDL,&status),
                  "MPI_Recv (service request)");
        MPI_Get_count(&status, MPI_BYTE, &nBytes);
        assert(nBytes == phi->nInBytes + sizeof(SRVHEAD));
        sid = phi->sid;

        nOutBytes = RunService(sid,phi->nInBytes,pszIn,reply_buffer.data());
        check_mpi(MPI_Send(reply_buffer.data(),nOutBytes,MPI_BYTE,phi->idFrom,MDL_TAG_RPL,commMDL),
                  "MPI_Send (service reply)");
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
    check_mpi(MPI_Send(buffer.data(),buffer.size(),MPI_BYTE,id,MDL_TAG_REQ,commMDL),"MPI_Send (service request)");
    return id;
}

int mdlClass::GetReply(int rID, void *vout) {
    MPI_Status status;
    int nBytes;
    check_mpi(MPI_Probe(rID,MDL_TAG_RPL,commMDL,&status),"MPI_Probe (service reply)");
    MPI_Get_count(&status, MPI_BYTE, &nBytes);
    std::vector<char> scratch;
    if (vout == nullptr) {
        scratch.resize(nBytes > 0 ? nBytes : 1);
        vout = scratch.data();
    }
    check_mpi(MPI_Recv(vout,nBytes,MPI_BYTE,rID,MDL_TAG_RPL,commMDL,MPI_STATUS_IGNORE),"MPI_Recv (service reply)");
    return nBytes;
}

void mdlClass::Barrier() {
    check_mpi(MPI_Barrier(commMDL),"MPI_Barrier");
}

void mdlClass::Allgather(const void *sbuf, int nBytes, void *rbuf) {
    check_mpi(MPI_Allgather(sbuf,nBytes,MPI_BYTE,rbuf,nBytes,MPI_BYTE,commMDL),"MPI_Allgather");
}

void mdlClass::Allgatherv(const void *sbuf, int nBytes, void *rbuf, const int *counts, const int *displs) {
    check_mpi(MPI_Allgatherv(sbuf,nBytes,MPI_BYTE,rbuf,counts,displs,MPI_BYTE,commMDL),"MPI_Allgatherv");
}

void mdlClass::Allreduce(const void *sbuf, void *rbuf, int count, mdl_datatype type, mdl_op op) {
    check_mpi(MPI_Allreduce(sbuf,rbuf,count,mpi_type(type),mpi_op(op),commMDL),"MPI_Allreduce");
}

int mdlClass::Sendrecv(const void *sbuf, int nSend, int idTo,
                       void *rbuf, int nRecv, int idFrom, int tag) {
    MPI_Status status;
    int nBytes;
    check_mpi(MPI_Sendrecv(sbuf,nSend,MPI_BYTE,idTo<0 ? MPI_PROC_NULL : idTo,MDL_TAG_USER+tag,
                           rbuf,nRecv,MPI_BYTE,idFrom<0 ? MPI_PROC_NULL : idFrom,MDL_TAG_USER+tag,
                           commMDL,&status),"MPI_Sendrecv");
    if (idFrom < 0) return 0;
    MPI_Get_count(&status, MPI_BYTE, &nBytes);
    if (nBytes != nRecv)
        throw std::runtime_error(fmt::format("Sendrecv: expected {} bytes from {} but received {}",nRecv,idFrom,nBytes));
    return nBytes;
}

void mdlAbort(MDL mdl) {
    abort();
}

void *mdlWORKER(void) {
    return mdl_global ? mdl_global->WorkerContext() : nullptr;
}

MDL mdlMDL(void) {
    return static_cast<MDL>(static_cast<mdlBASE *>(mdl_global));
}
