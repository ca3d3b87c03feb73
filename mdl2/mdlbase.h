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

#ifndef MDLBASE_H
#define MDLBASE_H
#include "hopchain_config.h"
#include <stdio.h>
#include <stdlib.h>
#include <stdint.h>
#include <stdarg.h>
#include <assert.h>

/*
* Compile time mdl debugging options
*
* mdl asserts: define MDLASSERT
* Probably should always be on unless you want no mdlDiag output at all
*
* NB: defining NDEBUG turns off all asserts so MDLASSERT will not assert
* however it will output uding mdlDiag and the code continues.
*/
#define MDLASSERT

typedef void *MDL;

#define SRV_STOP 0

#include <vector>
#include <string>
#include <memory>
#include <type_traits>
#define MAX_NODE_NAME_LENGTH      256

namespace mdl {
class BasicService {
    friend class mdlBASE;
private:
    int nInBytes;
    int nOutBytes;
    int service_id;
    std::string service_name;
public:
    explicit BasicService(int service_id, int nInBytes, int nOutBytes, const char *service_name="")
        : nInBytes(nInBytes), nOutBytes(nOutBytes), service_id(service_id),service_name(service_name) {}
    explicit BasicService(int service_id, int nInBytes, const char *service_name="")
        : nInBytes(nInBytes), nOutBytes(0), service_id(service_id),service_name(service_name) {}
    explicit BasicService(int service_id, const char *service_name="")
        : nInBytes(0), nOutBytes(0), service_id(service_id),service_name(service_name) {}
    virtual ~BasicService() = default;
    int getServiceID()  {return service_id;}
    int getMaxBytesIn() {return nInBytes;}
    int getMaxBytesOut() {return nOutBytes;}
    const std::string &getServiceName() const {return service_name;}
protected:
    virtual int operator()(int nIn, void *pIn, void *pOut) = 0;
};

// Reductions supported by Allreduce()
enum mdl_op {
    MDL_SUM,
    MDL_MAX,
    MDL_MIN,
    MDL_LOR,
};

enum mdl_datatype {
    MDL_INT32,
    MDL_INT64,
    MDL_UINT64,
    MDL_DOUBLE,
};

template<typename T> struct mdl_type;
template<> struct mdl_type<std::int32_t>  { static constexpr mdl_datatype value = MDL_INT32; };
template<> struct mdl_type<std::int64_t>  { static constexpr mdl_datatype value = MDL_INT64; };
template<> struct mdl_type<std::uint64_t> { static constexpr mdl_datatype value = MDL_UINT64; };
template<> struct mdl_type<double>        { static constexpr mdl_datatype value = MDL_DOUBLE; };

class mdlBASE {
public:
    int32_t nThreads; /* Global number of threads (total) */
    int32_t idSelf;   /* Global index of this thread */
    int32_t nProcs;   /* Number of global processes (e.g., MPI ranks) */
    int32_t iProc;    /* Index of this process (MPI rank) */
    int16_t nCores;   /* Number of threads in this process */
    int16_t iCore;    /* Local core id */
    int bDiag;        /* When true, debug output is enabled */
    int argc;

    FILE *fpDiag;
    char **argv;

    /* Services information */
    int nMaxInBytes;
    int nMaxOutBytes;
    std::vector< std::unique_ptr<BasicService> > services;

    /* Maps a give process (Proc) to the first global thread ID */
    std::vector<int> iProcToThread; /* [0,nProcs] (note inclusive extra element) */

    char nodeName[MAX_NODE_NAME_LENGTH];

public:
    void mdl_vprintf(const char *format, va_list ap);
    void mdl_printf(const char *format, ...);

public:
    explicit mdlBASE(int argc,char **argv);
    virtual ~mdlBASE();
    int32_t Threads() const { return nThreads; }
    int32_t Self()    const { return idSelf; }
    int16_t Core()    const { return iCore; }
    int16_t Cores()   const { return nCores; }
    int32_t Proc()    const { return iProc; }
    int32_t Procs()   const { return nProcs; }
    int32_t ProcToThread(int32_t iProc) const;
    int32_t ThreadToProc(int32_t iThread) const;
    void AddService(std::unique_ptr<BasicService> && service);
    BasicService *GetService(int sid);
    int  RunService(int sid, int nIn, void *pIn, void *pOut=nullptr);
    int  RunService(int sid, void *pOut) { return RunService(sid,0,nullptr,pOut); }
    void OpenDiagnostics(const char *pszDir);

public:
    // Ask thread "id" to run service "sid"; the reply is collected with GetReply().
    virtual int  ReqService(int id, int sid, void *vin=nullptr, int nIn=0) = 0;
    virtual int  GetReply(int rID, void *vout=nullptr) = 0;

    // Collectives. Every thread must make the same sequence of calls.
    virtual void Barrier() = 0;
    virtual void Allgather(const void *sbuf, int nBytes, void *rbuf) = 0;
    virtual void Allgatherv(const void *sbuf, int nBytes, void *rbuf, const int *counts, const int *displs) = 0;
    virtual void Allreduce(const void *sbuf, void *rbuf, int count, mdl_datatype type, mdl_op op) = 0;

    // Send nSend bytes to idTo while receiving exactly nRecv bytes from idFrom.
    // A peer of -1 means there is nothing to send (or receive).
    virtual int  Sendrecv(const void *sbuf, int nSend, int idTo,
                          void *rbuf, int nRecv, int idFrom, int tag) = 0;

public:
    template<typename T>
    T Allreduce(T value, mdl_op op) {
        T result;
        Allreduce(&value,&result,1,mdl_type<T>::value,op);
        return result;
    }

    template<typename T>
    std::vector<T> Allgather(const T &value) {
        static_assert(std::is_trivially_copyable<T>());
        std::vector<T> result(Threads());
        Allgather(&value,sizeof(T),result.data());
        return result;
    }

    template<typename T>
    std::vector<T> Allgatherv(const std::vector<T> &local) {
        static_assert(std::is_trivially_copyable<T>());
        auto counts = Allgather<int>(local.size() * sizeof(T));
        std::vector<int> displs(counts.size());
        int nTotal = 0;
        for (auto i=0; i<counts.size(); ++i) {
            displs[i] = nTotal;
            nTotal += counts[i];
        }
        std::vector<T> result(nTotal / sizeof(T));
        Allgatherv(local.data(),counts[Self()],result.data(),counts.data(),displs.data());
        return result;
    }
};

// Print a stack trace on fatal signals and std::terminate
void register_backtrace();
void show_backtrace(int skip=0);
} // namespace mdl

// Access to the command line through the opaque MDL handle
int mdlGetArgc(MDL mdl);
char **mdlGetArgv(MDL mdl);

#ifdef MDLASSERT
#ifndef __STRING
#define __STRING( arg )   (("arg"))
#endif
#define mdlassert(m,expr) \
    { \
    if (!(expr)) { \
    reinterpret_cast<mdl::mdlBASE *>(m)->mdl_printf( "%s:%d Assertion `%s' failed.\n", __FILE__, __LINE__, __STRING(expr) ); \
    assert( expr ); \
        } \
    }
#else
#define mdlassert(m,expr)  assert(expr)
#endif

#endif
