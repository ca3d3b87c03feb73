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

#include "mdlbase.h"
using namespace mdl;

#ifdef HAVE_UNISTD_H
    #include <unistd.h>
#endif
#include <string.h>
#include <stdexcept>
#include "fmt/format.h"

// Service 0 (SRV_STOP) does nothing; workers leave their loop after it.
class StopService : public BasicService {
public:
    StopService() : BasicService(SRV_STOP,"Stop") {}
protected:
    virtual int operator()(int nIn, void *pIn, void *pOut) override { return 0; }
};

/*****************************************************************************\
* mdlBASE
\*****************************************************************************/

#define MDL_DEFAULT_SERVICES    32

mdlBASE::mdlBASE(int argc,char **argv) {
    if (gethostname(nodeName, sizeof(nodeName)))
        nodeName[0] = 0;
    else
        nodeName[sizeof(nodeName) - 1] = 0;

    bDiag = 0;
    fpDiag = NULL;

    this->argc = argc;
    this->argv = argv;

    /* Some sensible defaults */
    nThreads = 1;
    idSelf = 0;
    nProcs = 1;
    iProc = 0;
    nCores = 1;
    iCore = 0;
    iProcToThread = {0,1};

    // Grown by AddService() as services are registered
    nMaxInBytes  = 0;
    nMaxOutBytes = 0;
    services.resize(MDL_DEFAULT_SERVICES);
    services[SRV_STOP] = std::make_unique<StopService>();
}

mdlBASE::~mdlBASE() {
    // Close Diagnostic file.
    if (bDiag && fpDiag) fclose(fpDiag);
}

// One file per thread: <dir>/<program>.<thread>
void mdlBASE::OpenDiagnostics(const char *pszDir) {
    const char *tmp = strrchr(argv[0], '/');
    if (!tmp) tmp = argv[0];
    else ++tmp;
    auto achDiag = fmt::format("{}/{}.{}",pszDir,tmp,Self());
    fpDiag = fopen(achDiag.c_str(), "w");
    if (fpDiag == NULL) throw std::runtime_error("unable to open diagnostic file " + achDiag);
    bDiag = 1;
}

/* O(1): Given a process id, return the first global thread id */
int32_t mdlBASE::ProcToThread(int32_t iProc) const {
    assert(iProc >= 0 && iProc <= nProcs);
    return iProcToThread[iProc];
}

/* O(l2(nProc)): Given a global thread id, return the process to which it belongs */
int32_t mdlBASE::ThreadToProc(int32_t iThread) const {
    int l=0, u=nProcs;
    assert(iThread >= 0 && iThread <= nThreads);
    assert(nThreads == iProcToThread[nProcs]);
    while (l <= u) {
        int m = (u + l) / 2;
        if (iThread < iProcToThread[m]) u = m - 1;
        else l = m+1;
    }
    return l-1;
}

void mdlBASE::AddService(std::unique_ptr<BasicService> &&service) {
    auto sid = service->getServiceID();
    if (service->getMaxBytesIn()  > nMaxInBytes)  nMaxInBytes  = service->getMaxBytesIn();
    if (service->getMaxBytesOut() > nMaxOutBytes) nMaxOutBytes = service->getMaxBytesOut();
    if (sid >= services.size()) services.resize(sid+9);
    assert(services[sid]==nullptr);
    services[sid] = std::move(service);
}

BasicService *mdlBASE::GetService(int sid) {
    assert(sid < services.size());
    return services[sid].get();
}

int mdlBASE::RunService(int sid,int nIn, void *pIn, void *pOut) {
    if (sid >= services.size() || services[sid] == nullptr)
        throw std::runtime_error(fmt::format("service {} is not registered",sid));
    return (*services[sid])(nIn,pIn,pOut);
}

int mdlGetArgc(MDL mdl) {
    return static_cast<mdlBASE *>(mdl)->argc;
}

char **mdlGetArgv(MDL mdl) {
    return static_cast<mdlBASE *>(mdl)->argv;
}

void mdlBASE::mdl_vprintf(const char *format, va_list ap) {
    if (bDiag) {
        vfprintf(fpDiag, format, ap);
        fflush(fpDiag);
    }
}
void mdlBASE::mdl_printf(const char *format, ...) {
    va_list args;
    va_start(args, format);
    mdl_vprintf(format,args);
    va_end(args);
}
