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

#include "parameters.h"
#include "fmt/format.h"

// A SimpleNamespace holding one attribute for each name in kwargs
static PyObject *make_namespace(PyObject *kwargs) {
    auto types = PyImport_ImportModule("types");
    if (!types) {
        PyErr_Print();
        throw std::runtime_error("unable to import types");
    }
    auto cls = PyObject_GetAttrString(types,"SimpleNamespace");
    Py_DECREF(types);
    auto args = PyTuple_New(0);
    auto ns = PyObject_Call(cls,args,kwargs);
    Py_DECREF(args);
    Py_DECREF(cls);
    if (!ns) {
        PyErr_Print();
        throw std::runtime_error("unable to create parameter namespace");
    }
    return ns;
}

hop_parameters::hop_parameters() {
    auto defaults = Py_BuildValue("{s:d,s:d,s:d,s:i,s:i,s:i,s:d,s:O,s:d,s:i,s:L,s:i,s:d,s:d,s:i,s:O,s:i}",
                                  "dThreshold",160.0,
                                  "dSaddleFactor",2.5,
                                  "dPeakFactor",3.0,
                                  "nSmooth",64,
                                  "nMerge",4,
                                  "nMinMembers",0,
                                  "dBoxSize",1.0,
                                  "bPeriodic",Py_True,
                                  "dPadding",0.05,
                                  "nDomains",0,
                                  "nParticles",32768LL,
                                  "nClusters",8,
                                  "dClusterFraction",0.5,
                                  "dClusterRadius",0.02,
                                  "iSeed",1,
                                  "bVStep",Py_True,
                                  "nMaxRounds",0);
    if (!defaults) {
        PyErr_Print();
        throw std::runtime_error("unable to build default parameters");
    }
    arguments_ = make_namespace(defaults);
    // Nothing has been specified yet
    PyObject *key, *value;
    Py_ssize_t pos = 0;
    while (PyDict_Next(defaults, &pos, &key, &value)) PyDict_SetItem(defaults,key,Py_False);
    specified_ = make_namespace(defaults);
    Py_DECREF(defaults);
}

void hop_parameters::validate() const {
    if (!(dThreshold() > 0.0))
        throw std::domain_error(fmt::format("dThreshold must be positive (dThreshold={})",dThreshold()));
    if (!(dSaddleFactor() > 0.0) || !(dPeakFactor() > 0.0))
        throw std::domain_error(fmt::format("dSaddleFactor ({}) and dPeakFactor ({}) must be positive",
                                            dSaddleFactor(),dPeakFactor()));
    if (nSmooth() < 1)
        throw std::domain_error(fmt::format("nSmooth must be at least 1 (nSmooth={})",nSmooth()));
    if (nMerge() < 0 || nMerge() + 2 > nSmooth())
        throw std::domain_error(fmt::format("nMerge+2 ({}) must not exceed nSmooth ({})",nMerge()+2,nSmooth()));
    if (!(dBoxSize() > 0.0))
        throw std::domain_error(fmt::format("dBoxSize must be positive (dBoxSize={})",dBoxSize()));
    if (dPadding() < 0.0)
        throw std::domain_error(fmt::format("dPadding must not be negative (dPadding={})",dPadding()));
    if (nParticles() < 1)
        throw std::domain_error(fmt::format("nParticles must be positive (nParticles={})",nParticles()));
    if (nClusters() < 0 || dClusterFraction() < 0.0 || dClusterFraction() > 1.0 || dClusterRadius() < 0.0)
        throw std::domain_error(fmt::format("invalid cluster parameters (nClusters={} dClusterFraction={} dClusterRadius={})",
                                            nClusters(),dClusterFraction(),dClusterRadius()));
}
