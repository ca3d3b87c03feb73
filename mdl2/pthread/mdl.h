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

#ifndef MDL_H
#define MDL_H
#include "mdlbase.h"
#include <pthread.h>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <vector>

namespace mdl {

/*
** Messages are copied into the mailbox of the receiving thread. A receive
** matches on source (or any source) and tag, in arrival order.
*/
typedef struct mbxMessage {
    int idFrom;
    int tag;
    std::vector<char> data;
} MBX;

// State shared by every thread of the process
class threadShared {
public:
    int nThreads;
    pthread_barrier_t barrier;
    std::mutex mux;
    std::condition_variable sigRec;
    std::vector< std::deque<MBX> > mailbox;
    std::vector<const void *> slots;
    std::vector<int> sizes;

    explicit threadShared(int nThreads);
    ~threadShared();
};

class mdlClass : public mdlBASE {
public:
    enum mdl_tags {
        MDL_TAG_REQ=1,
        MDL_TAG_RPL=2,
        MDL_TAG_USER=16,
    };
    typedef struct {
        int32_t idFrom;
        int32_t sid;
        int32_t nInBytes;
    } SRVHEAD;

protected:
    threadShared *shared;
    void *worker_ctx;
    int (*fcnMaster)(MDL,void *);
    void *(*fcnWorkerInit)(MDL);
    void (*fcnWorkerDone)(MDL,void *);

protected:
    void Send(const void *buf, int nBytes, int idTo, int tag);
    MBX  Recv(int idFrom, int tag);
    void Handler();
    void stop_workers();

public:
    explicit mdlClass(threadShared *shared, int iThread,
                      int (*fcnMaster)(MDL,void *),void *(*fcnWorkerInit)(MDL),void (*fcnWorkerDone)(MDL,void *),
                      int argc=0, char **argv=0);
    virtual ~mdlClass();
    int  Run(const char *pszDiag);
    void *WorkerContext() const { return worker_ctx; }

    virtual int  ReqService(int id, int sid, void *vin=nullptr, int nIn=0) override;
    virtual int  GetReply(int rID, void *vout=nullptr) override;
    virtual void Barrier() override;
    virtual void Allgather(const void *sbuf, int nBytes, void *rbuf) override;
    virtual void Allgatherv(const void *sbuf, int nBytes, void *rbuf, const int *counts, const int *displs) override;
    virtual void Allreduce(const void *sbuf, void *rbuf, int count, mdl_datatype type, mdl_op op) override;
    virtual int  Sendrecv(const void *sbuf, int nSend, int idTo,
                          void *rbuf, int nRecv, int idFrom, int tag) override;
    using mdlBASE::Allreduce;
    using mdlBASE::Allgather;
    using mdlBASE::Allgatherv;
};
} // namespace mdl

int mdlLaunch(int,char **,int (*)(MDL,void *),void *(*)(MDL),void (*)(MDL,void *));
void mdlAbort(MDL);
void *mdlWORKER(void);
MDL mdlMDL(void);

#endif
