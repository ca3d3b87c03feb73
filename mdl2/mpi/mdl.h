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
#include <mpi.h>
#include <vector>

namespace mdl {

/*
** One MPI rank per worker. Rank zero runs the master; every other rank
** waits in Handler() for service requests until it receives SRV_STOP.
*/
class mdlClass : public mdlBASE {
public:
    typedef struct {
        int32_t idFrom;
        int32_t sid;
        int32_t nInBytes;
    } SRVHEAD;

    enum mdl_tags {
        MDL_TAG_REQ=1,
        MDL_TAG_RPL=2,
        MDL_TAG_USER=16,
    };

protected:
    MPI_Comm commMDL;
    int (*fcnMaster)(MDL,void *);
    void *(*fcnWorkerInit)(MDL);
    void (*fcnWorkerDone)(MDL,void *);
    void *worker_ctx;
    std::vector<char> input_buffer;
    std::vector<char> reply_buffer;

protected:
    void Handler();
    int run_master();
    void stop_workers();

public:
    explicit mdlClass(int (*fcnMaster)(MDL,void *),void *(*fcnWorkerInit)(MDL),void (*fcnWorkerDone)(MDL,void *),
                      int argc=0, char **argv=0);
    virtual ~mdlClass();
    int Launch();
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
