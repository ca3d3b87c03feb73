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

#include "hopchain_config.h"

#include <stdio.h>
#include <stdlib.h>
#include <stdexcept>
#include "Python.h"
#include "fmt/format.h"
#include "mdl.h"
#include "pst.h"
#include "master.h"
#include "parameters.h"

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
    auto pst = reinterpret_cast<PST>(vpst);
    int argc = mdlGetArgc(mdl);
    char **argv = mdlGetArgv(mdl);
    int rc = 0;

    Py_Initialize();
    try {
        hop_parameters parameters;
        if (argc > 1 && !parameters.load(argv[1]))
            throw std::domain_error(fmt::format("{} sets names that are not parameters",argv[1]));
        parameters.validate();
        printf("%s using Python %d.%d.%d\n", PACKAGE_STRING, PY_MAJOR_VERSION, PY_MINOR_VERSION, PY_MICRO_VERSION );

        MSR msr(mdl,pst,parameters);
        auto summary = msr.Hop();
        msr.Report(summary);
    }
    catch (const std::domain_error &e) {
        fmt::print(stderr,"ERROR: {}\n",e.what());
        rc = 2;
    }
    catch (const std::exception &e) {
        fmt::print(stderr,"ERROR: {}\n",e.what());
        rc = 1;
    }
    Py_Finalize();
    return rc;
}

int main(int argc,char **argv) {
    /* no stdout buffering */
    setbuf(stdout,(char *) NULL);

    return mdlLaunch(argc,argv,master,worker_init,worker_done);
}
