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

#include "pyrameters.h"
#include <cstring>
#include <string>

bool pyrameters::has(const char *name) const {
    bool bSpecified = false;
    if (auto f = PyObject_GetAttrString(specified_,name)) {
        bSpecified = PyObject_IsTrue(f)>0;
        Py_DECREF(f);
    }
    else PyErr_Clear();
    return bSpecified;
}

// Skip names starting with an underscore as well as modules and
// callables imported from other modules.
static bool ignored(PyObject *key,PyObject *value) {
    if (PyUnicode_Check(key)) {
        auto keyString = PyUnicode_AsUTF8(key);
        if (keyString && keyString[0]=='_') return true;
    }
    if (PyModule_Check(value)) return true;
    if (PyCallable_Check(value)) {
        auto module = PyObject_GetAttrString(value,"__module__");
        bool bForeign = false;
        if (module && PyUnicode_Check(module)) {
            auto result = PyUnicode_AsUTF8(module);
            bForeign = result && strcmp(result,"__main__")!=0 && strcmp(result,"<run_path>")!=0;
        }
        Py_XDECREF(module);
        PyErr_Clear();
        return bForeign;
    }
    return false;
}

bool pyrameters::update(PyObject *kwobj) {
    PyObject *key, *value;
    Py_ssize_t pos = 0;
    bool bSuccess = true;
    while (PyDict_Next(kwobj, &pos, &key, &value)) {
        if (ignored(key,value) || PyObject_HasAttr(arguments_,key)) continue;
        PyErr_Format(PyExc_AttributeError,"invalid parameter %A",key);
        PyErr_Print();
        bSuccess = false;
    }
    if (!bSuccess) return false;
    pos = 0;
    while (PyDict_Next(kwobj, &pos, &key, &value)) {
        if (ignored(key,value)) continue;
        PyObject_SetAttr(arguments_,key,value);
        PyObject_SetAttr(specified_,key,Py_True);
    }
    return true;
}

bool pyrameters::load(const char *filename) {
    auto runpy = PyImport_ImportModule("runpy");
    if (!runpy) {
        PyErr_Print();
        throw std::runtime_error("unable to import runpy");
    }
    auto globals = PyObject_CallMethod(runpy,"run_path","s",filename);
    Py_DECREF(runpy);
    if (!globals) {
        PyErr_Print();
        throw std::runtime_error(std::string("error running parameter file ") + filename);
    }
    bool bSuccess = update(globals);
    Py_DECREF(globals);
    return bSuccess;
}

template<> PyObject *pyrameters::get<PyObject *>(const char *name) const {
    auto v = PyObject_GetAttrString(arguments_, name);
    if (!v) {
        PyErr_Clear();
        throw std::domain_error(std::string("unknown parameter ") + name);
    }
    if (PyCallable_Check(v)) {
        auto callback = v;
        v = PyObject_CallNoArgs(callback);
        Py_DECREF(callback);
        if (!v) {
            PyErr_Print();
            throw std::domain_error(std::string("parameter callback failed for ") + name);
        }
    }
    return v;
}
